#ifndef BYTEKIT_SRC_CHARSET_LITTLEENDIAN_HPP
#define BYTEKIT_SRC_CHARSET_LITTLEENDIAN_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace bytekit::charset::detail
{

constexpr std::size_t g_kU32Bytes{ sizeof(std::uint32_t) };
constexpr std::uint32_t g_kBitsPerByte{ 8U };

[[nodiscard]] inline std::uint32_t readU32LE(std::span<const std::uint8_t, g_kU32Bytes> in) noexcept
{
    std::uint32_t v{ 0U };
    for (std::size_t i{}; i < in.size(); ++i)
    {
        const std::uint32_t shiftBits{ static_cast<std::uint32_t>(i) * g_kBitsPerByte };
        v |= (static_cast<std::uint32_t>(in[i]) << shiftBits);
    }
    return v;
}

} // namespace bytekit::charset::detail

#endif // BYTEKIT_SRC_CHARSET_LITTLEENDIAN_HPP
