#ifndef INCLUDE_BYTEKIT_IO_SCOPECLOSE_HPP
#define INCLUDE_BYTEKIT_IO_SCOPECLOSE_HPP

#include "bytekit/io/IByteSource.hpp"

namespace bytekit::io
{
class [[nodiscard]] ScopeClose final
{
public:
    ScopeClose(const ScopeClose&) = delete;
    ScopeClose& operator=(const ScopeClose&) = delete;

    explicit ScopeClose(IByteSource& source) noexcept : m_source{ &source }
    {
    }

    ScopeClose(ScopeClose&& other) noexcept : m_source{ other.m_source }
    {
        other.m_source = nullptr;
    }

    ScopeClose& operator=(ScopeClose&& other) noexcept
    {
        if (this == &other)
        {
            return *this;
        }
        closeNow();
        m_source = other.m_source;
        other.m_source = nullptr;
        return *this;
    }

    ~ScopeClose() noexcept
    {
        closeNow();
    }

    // Closes the source immediately instead of at scope exit.
    void closeNow() noexcept
    {
        if (m_source == nullptr)
        {
            return;
        }
        m_source->close();
        m_source = nullptr;
    }

private:
    IByteSource* m_source{ nullptr };
};

[[nodiscard]] inline ScopeClose scopeClose(IByteSource& source) noexcept
{
    return ScopeClose{ source };
}

} // namespace bytekit::io

#endif // INCLUDE_BYTEKIT_IO_SCOPECLOSE_HPP
