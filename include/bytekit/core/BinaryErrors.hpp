#ifndef INCLUDE_BYTEKIT_CORE_BINARYERRORS_HPP
#define INCLUDE_BYTEKIT_CORE_BINARYERRORS_HPP

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace bytekit::core
{

class InvalidArgument final : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

class TypeError final : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

class UnsupportedEncoding final : public std::runtime_error
{
public:
    explicit UnsupportedEncoding(std::string charset)
        : std::runtime_error("unsupported encoding: " + charset), m_charset(std::move(charset))
    {
    }

    [[nodiscard]] const std::string& charset() const noexcept
    {
        return m_charset;
    }

private:
    std::string m_charset;
};

// Raised when a byte source fails mid-read. The source has already been closed.
class IoFailure final : public std::runtime_error
{
public:
    IoFailure(const std::string& what, std::exception_ptr cause)
        : std::runtime_error(what), m_cause(std::move(cause))
    {
    }

    [[nodiscard]] std::exception_ptr cause() const noexcept
    {
        return m_cause;
    }

    [[noreturn]] void rethrowCause() const
    {
        std::rethrow_exception(m_cause);
    }

private:
    std::exception_ptr m_cause;
};

} // namespace bytekit::core

#endif // INCLUDE_BYTEKIT_CORE_BINARYERRORS_HPP
