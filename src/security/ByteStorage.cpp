#include "bytekit/security/ByteStorage.hpp"

#include "bytekit/security/MemoryWiper.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace bytekit::security
{

ByteStorage::ByteStorage(std::size_t capacity)
{
    if (capacity > maxCapacity())
    {
        throw std::length_error{ "byte storage capacity too large" };
    }
    if (capacity != 0U)
    {
        // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
        m_bytes = std::unique_ptr<std::uint8_t[], WipeOnRelease>{ new std::uint8_t[capacity](),
                                                                   WipeOnRelease{ capacity } };
    }
}

void ByteStorage::wipe(std::size_t from, std::size_t to) noexcept
{
    secureWipeRange(asSpan(*this), from, to);
}

void ByteStorage::WipeOnRelease::operator()(std::uint8_t* p) const noexcept
{
    secureWipe(std::span<std::uint8_t>{ p, bytes });
    delete[] p;
}

ByteStorage makeStorage(std::span<const std::uint8_t> prefix, std::size_t capacity)
{
    ByteStorage out(std::max(capacity, prefix.size()));
    if (!prefix.empty())
    {
        std::memcpy(out.data(), prefix.data(), prefix.size());
    }
    return out;
}

void reallocateStorage(ByteStorage& s, std::size_t keep, std::size_t capacity)
{
    const std::size_t kept{ std::min({ keep, capacity, s.size() }) };
    ByteStorage next(capacity);
    if (kept != 0U)
    {
        std::memcpy(next.data(), s.data(), kept);
    }
    s.swap(next);
}

} // namespace bytekit::security
