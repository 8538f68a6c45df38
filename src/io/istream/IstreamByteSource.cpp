#include "bytekit/io/sources/IstreamSourceFactory.hpp"

#include <cstddef>
#include <cstdint>
#include <ios>
#include <span>
#include <stdexcept>
#include <utility>

namespace bytekit::io::sources
{
namespace
{

class IstreamByteSource final : public bytekit::io::IByteSource
{
public:
    explicit IstreamByteSource(std::unique_ptr<std::istream> in) noexcept : m_in{ std::move(in) }
    {
    }

    [[nodiscard]] std::size_t read(std::span<std::uint8_t> out) override
    {
        if (m_in == nullptr)
        {
            throw std::runtime_error{ "read from closed stream source" };
        }
        if (m_in->fail() && !m_in->eof())
        {
            throw std::runtime_error{ "stream is not readable" };
        }
        if (out.empty() || m_in->eof())
        {
            return 0U;
        }

        m_in->read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
        const std::streamsize got{ m_in->gcount() };
        if (m_in->bad())
        {
            throw std::runtime_error{ "stream read failed" };
        }
        return static_cast<std::size_t>(got);
    }

    void close() noexcept override
    {
        m_in.reset();
    }

    [[nodiscard]] bool isClosed() const noexcept override
    {
        return m_in == nullptr;
    }

private:
    std::unique_ptr<std::istream> m_in;
};

} // namespace

std::unique_ptr<bytekit::io::IByteSource> makeIstreamSource(std::unique_ptr<std::istream> in)
{
    if (in == nullptr)
    {
        throw std::invalid_argument{ "makeIstreamSource: null stream" };
    }
    return std::make_unique<IstreamByteSource>(std::move(in));
}

} // namespace bytekit::io::sources
