#ifndef INCLUDE_BYTEKIT_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_BYTEKIT_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace bytekit::security
{
// Zeroes the region in a way the optimizer may not elide.
void secureWipe(std::span<std::uint8_t> bytes) noexcept;

// Zeroes [from, to) of `buffer`, clamped to its bounds.
void secureWipeRange(std::span<std::uint8_t> buffer, std::size_t from, std::size_t to) noexcept;
} // namespace bytekit::security
#endif // INCLUDE_BYTEKIT_SECURITY_MEMORYWIPER_HPP
