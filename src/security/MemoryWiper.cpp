#include "bytekit/security/MemoryWiper.hpp"

#include <algorithm>

#if defined(__linux__)
#include <string.h>
#else
#error Unsupported platform
#endif

namespace bytekit::security
{
void secureWipe(std::span<std::uint8_t> bytes) noexcept
{
    if (bytes.empty())
    {
        return;
    }
    ::explicit_bzero(bytes.data(), bytes.size());
}

void secureWipeRange(std::span<std::uint8_t> buffer, std::size_t from, std::size_t to) noexcept
{
    to = std::min(to, buffer.size());
    if (from >= to)
    {
        return;
    }
    secureWipe(buffer.subspan(from, to - from));
}
} // namespace bytekit::security
