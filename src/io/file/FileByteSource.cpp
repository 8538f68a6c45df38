#include "bytekit/io/sources/FileSourceFactory.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace bytekit::io::sources
{
namespace
{

class FileByteSource final : public bytekit::io::IByteSource
{
public:
    explicit FileByteSource(int fd) noexcept : m_fd{ fd }
    {
    }

    ~FileByteSource() override
    {
        close();
    }

    [[nodiscard]] std::size_t read(std::span<std::uint8_t> out) override
    {
        if (m_fd < 0)
        {
            throw std::system_error{ EBADF, std::generic_category(), "read from closed file source" };
        }
        if (out.empty())
        {
            return 0U;
        }

        for (;;)
        {
            const ssize_t got{ ::read(m_fd, out.data(), out.size()) };
            if (got >= 0)
            {
                return static_cast<std::size_t>(got);
            }
            if (errno == EINTR)
            {
                continue;
            }
            throw std::system_error{ errno, std::generic_category(), "read failed" };
        }
    }

    void close() noexcept override
    {
        if (m_fd < 0)
        {
            return;
        }
        (void)::close(m_fd);
        m_fd = -1;
    }

    [[nodiscard]] bool isClosed() const noexcept override
    {
        return m_fd < 0;
    }

private:
    int m_fd{ -1 };
};

} // namespace

std::unique_ptr<bytekit::io::IByteSource> openFileSource(const std::filesystem::path& path)
{
    int fd{ -1 };
    do
    {
        fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0)
    {
        throw std::system_error{ errno, std::generic_category(), "cannot open " + path.string() };
    }
    return std::make_unique<FileByteSource>(fd);
}

} // namespace bytekit::io::sources
