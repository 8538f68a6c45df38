#ifndef INCLUDE_BYTEKIT_SECURITY_BYTESTORAGE_HPP
#define INCLUDE_BYTEKIT_SECURITY_BYTESTORAGE_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <span>

namespace bytekit::security
{
// Backing region of a buffer. size() is the allocated capacity; the logical length is tracked by
// the owner. The whole region is wiped before it goes back to the heap, whether it is released by
// a reallocation, by assignment or by destruction.
class ByteStorage final
{
public:
    ByteStorage() noexcept = default;

    // Zero-filled region of `capacity` bytes. Throws std::length_error above maxCapacity().
    explicit ByteStorage(std::size_t capacity);

    [[nodiscard]] static constexpr std::size_t maxCapacity() noexcept
    {
        return static_cast<std::size_t>(std::numeric_limits<std::ptrdiff_t>::max());
    }

    [[nodiscard]] std::size_t size() const noexcept
    {
        return m_bytes ? m_bytes.get_deleter().bytes : 0U;
    }

    [[nodiscard]] std::uint8_t* data() noexcept
    {
        return m_bytes.get();
    }

    [[nodiscard]] const std::uint8_t* data() const noexcept
    {
        return m_bytes.get();
    }

    [[nodiscard]] std::uint8_t& operator[](std::size_t i) noexcept
    {
        return m_bytes[i];
    }

    [[nodiscard]] std::uint8_t operator[](std::size_t i) const noexcept
    {
        return m_bytes[i];
    }

    [[nodiscard]] const std::uint8_t* begin() const noexcept
    {
        return data();
    }

    [[nodiscard]] const std::uint8_t* end() const noexcept
    {
        return data() + size();
    }

    void swap(ByteStorage& other) noexcept
    {
        m_bytes.swap(other.m_bytes);
    }

    // Zeroes [from, to), clamped to the region.
    void wipe(std::size_t from, std::size_t to) noexcept;

private:
    struct WipeOnRelease final
    {
        std::size_t bytes;

        void operator()(std::uint8_t* p) const noexcept;
    };

    std::unique_ptr<std::uint8_t[], WipeOnRelease> m_bytes{};
};

[[nodiscard]] inline std::span<std::uint8_t> asSpan(ByteStorage& s) noexcept
{
    return { s.data(), s.size() };
}

[[nodiscard]] inline std::span<const std::uint8_t> asSpan(const ByteStorage& s) noexcept
{
    return { s.data(), s.size() };
}

// Allocates a zero-filled region of `capacity` bytes holding a copy of `prefix`.
[[nodiscard]] ByteStorage makeStorage(std::span<const std::uint8_t> prefix, std::size_t capacity);

// Moves the first `keep` bytes into a fresh region of `capacity` bytes. The old region is wiped
// when it is released.
void reallocateStorage(ByteStorage& s, std::size_t keep, std::size_t capacity);

} // namespace bytekit::security

#endif // INCLUDE_BYTEKIT_SECURITY_BYTESTORAGE_HPP
