#include "bytekit/core/Value.hpp"
#include "bytekit/core/Binary.hpp"
#include <cmath>
#include <limits>
#include <string>

namespace bytekit::core
{
namespace
{

constexpr std::size_t g_kMaxDescribedText{ 32U };

[[nodiscard]] std::string quoted(const std::string& s)
{
    if (s.size() <= g_kMaxDescribedText)
    {
        return "\"" + s + "\"";
    }
    return "\"" + s.substr(0U, g_kMaxDescribedText) + "...\"";
}

} // namespace

std::string_view valueKindName(ValueKind kind) noexcept
{
    switch (kind)
    {
    case ValueKind::Undefined:
        return "undefined";
    case ValueKind::Integer:
        return "integer";
    case ValueKind::Real:
        return "number";
    case ValueKind::Text:
        return "string";
    case ValueKind::Bytes:
        return "bytes";
    case ValueKind::Binary:
        return "binary";
    case ValueKind::Sequence:
        return "sequence";
    case ValueKind::Source:
        return "source";
    }
    return "unknown";
}

std::optional<std::int64_t> Value::toInteger() const noexcept
{
    if (const auto* i{ std::get_if<std::int64_t>(&m_data) }; i != nullptr)
    {
        return *i;
    }
    if (const auto* d{ std::get_if<double>(&m_data) }; d != nullptr)
    {
        if (std::isnan(*d))
        {
            return std::int64_t{ 0 };
        }
        constexpr auto kMin{ static_cast<double>(std::numeric_limits<std::int64_t>::min()) };
        constexpr auto kMax{ static_cast<double>(std::numeric_limits<std::int64_t>::max()) };
        if (*d <= kMin)
        {
            return std::numeric_limits<std::int64_t>::min();
        }
        if (*d >= kMax)
        {
            return std::numeric_limits<std::int64_t>::max();
        }
        return static_cast<std::int64_t>(std::trunc(*d));
    }
    return std::nullopt;
}

std::string Value::describe() const
{
    switch (kind())
    {
    case ValueKind::Undefined:
        return "undefined";
    case ValueKind::Integer:
        return std::to_string(std::get<std::int64_t>(m_data));
    case ValueKind::Real:
        return std::to_string(std::get<double>(m_data));
    case ValueKind::Text:
        return quoted(std::get<std::string>(m_data));
    case ValueKind::Bytes:
        return "bytes(" + std::to_string(std::get<std::vector<std::uint8_t>>(m_data).size()) + ")";
    case ValueKind::Binary:
    {
        const auto& b{ std::get<BinaryPtr>(m_data) };
        return (b == nullptr) ? std::string{ "null" } : b->toString();
    }
    case ValueKind::Sequence:
        return "sequence(" + std::to_string(std::get<Sequence>(m_data).size()) + ")";
    case ValueKind::Source:
        return "source";
    }
    return "unknown";
}

} // namespace bytekit::core
