#ifndef INCLUDE_BYTEKIT_CORE_VALUE_HPP
#define INCLUDE_BYTEKIT_CORE_VALUE_HPP

#include <concepts>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bytekit::io
{
class IByteSource;
} // namespace bytekit::io

namespace bytekit::core
{

class Binary;
using BinaryPtr = std::shared_ptr<Binary>;

enum class ValueKind : std::uint8_t
{
    Undefined,
    Integer,
    Real,
    Text,
    Bytes,
    Binary,
    Sequence,
    Source,
};

[[nodiscard]] std::string_view valueKindName(ValueKind kind) noexcept;

// A loosely typed argument as handed over by an embedding caller: construction inputs, split
// delimiters and concat operands are all Values.
class Value final
{
public:
    using Sequence = std::vector<Value>;
    using SourcePtr = std::shared_ptr<bytekit::io::IByteSource>;

    Value() = default;

    template <std::integral T>
        requires(!std::same_as<T, bool>)
    Value(T v) : m_data{ static_cast<std::int64_t>(v) } // NOLINT(google-explicit-constructor)
    {
    }

    Value(double v) : m_data{ v } // NOLINT(google-explicit-constructor)
    {
    }

    // Would otherwise convert through double.
    Value(bool) = delete;

    Value(std::string v) : m_data{ std::move(v) } // NOLINT(google-explicit-constructor)
    {
    }

    Value(const char* v) : m_data{ std::string{ v } } // NOLINT(google-explicit-constructor)
    {
    }

    Value(std::vector<std::uint8_t> v) : m_data{ std::move(v) } // NOLINT(google-explicit-constructor)
    {
    }

    Value(BinaryPtr v) : m_data{ std::move(v) } // NOLINT(google-explicit-constructor)
    {
    }

    Value(Sequence v) : m_data{ std::move(v) } // NOLINT(google-explicit-constructor)
    {
    }

    Value(SourcePtr v) : m_data{ std::move(v) } // NOLINT(google-explicit-constructor)
    {
    }

    [[nodiscard]] ValueKind kind() const noexcept
    {
        return static_cast<ValueKind>(m_data.index());
    }

    [[nodiscard]] bool isNumber() const noexcept
    {
        return kind() == ValueKind::Integer || kind() == ValueKind::Real;
    }

    // Integer value of a number, truncating reals toward zero. nullopt for non-numbers.
    [[nodiscard]] std::optional<std::int64_t> toInteger() const noexcept;

    [[nodiscard]] const double* real() const noexcept
    {
        return std::get_if<double>(&m_data);
    }

    [[nodiscard]] const std::string* text() const noexcept
    {
        return std::get_if<std::string>(&m_data);
    }

    [[nodiscard]] const std::vector<std::uint8_t>* bytes() const noexcept
    {
        return std::get_if<std::vector<std::uint8_t>>(&m_data);
    }

    [[nodiscard]] BinaryPtr binary() const noexcept
    {
        if (const auto* p{ std::get_if<BinaryPtr>(&m_data) }; p != nullptr)
        {
            return *p;
        }
        return nullptr;
    }

    [[nodiscard]] const Sequence* sequence() const noexcept
    {
        return std::get_if<Sequence>(&m_data);
    }

    [[nodiscard]] SourcePtr source() const noexcept
    {
        if (const auto* p{ std::get_if<SourcePtr>(&m_data) }; p != nullptr)
        {
            return *p;
        }
        return nullptr;
    }

    // Short human-readable rendering used in error messages.
    [[nodiscard]] std::string describe() const;

private:
    // Alternative order matches ValueKind.
    std::variant<std::monostate, std::int64_t, double, std::string, std::vector<std::uint8_t>, BinaryPtr, Sequence,
                 SourcePtr>
        m_data;
};

} // namespace bytekit::core

#endif // INCLUDE_BYTEKIT_CORE_VALUE_HPP
