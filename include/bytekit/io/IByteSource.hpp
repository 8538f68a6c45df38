#ifndef INCLUDE_BYTEKIT_IO_IBYTESOURCE_HPP
#define INCLUDE_BYTEKIT_IO_IBYTESOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace bytekit::io
{

class IByteSource
{
public:
    IByteSource() = default;
    IByteSource(const IByteSource&) = delete;
    IByteSource& operator=(const IByteSource&) = delete;
    IByteSource(IByteSource&&) = delete;
    IByteSource& operator=(IByteSource&&) = delete;
    virtual ~IByteSource() = default;

    // Reads at most out.size() bytes and returns how many were written; 0 means end of stream.
    // Failures are reported by throwing.
    [[nodiscard]] virtual std::size_t read(std::span<std::uint8_t> out) = 0;

    // Releases the underlying resource. Must be idempotent.
    virtual void close() noexcept = 0;

    [[nodiscard]] virtual bool isClosed() const noexcept = 0;
};

} // namespace bytekit::io

#endif // INCLUDE_BYTEKIT_IO_IBYTESOURCE_HPP
