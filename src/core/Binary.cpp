#include "bytekit/core/Binary.hpp"
#include "bytekit/charset/Charset.hpp"
#include "bytekit/core/BinaryErrors.hpp"
#include "bytekit/core/Config.hpp"
#include "bytekit/log/Log.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <mutex>
#include <utility>

namespace bytekit::core
{
namespace
{

using Pattern = std::vector<std::uint8_t>;

constexpr std::uint64_t g_kByteMask{ 0xFFU };

[[nodiscard]] std::uint8_t lowByte(std::int64_t value) noexcept
{
    return static_cast<std::uint8_t>(static_cast<std::uint64_t>(value) & g_kByteMask);
}

[[nodiscard]] std::optional<std::size_t> inBounds(Index index, std::size_t length) noexcept
{
    if (index < 0 || static_cast<std::uint64_t>(index) >= length)
    {
        return std::nullopt;
    }
    return static_cast<std::size_t>(index);
}

// max(lo, min(hi, v)); unlike std::clamp, hi may be below lo.
[[nodiscard]] Index clampIndex(Index value, Index lo, Index hi) noexcept
{
    return std::max(lo, std::min(hi, value));
}

void rejectNegativeIndex(Kind kind, Index index)
{
    if (index >= 0)
    {
        return;
    }
    bytekit::log::logger()->debug("{}: rejected negative index {}", kindName(kind), index);
    throw InvalidArgument{ "negative " + std::string{ kindName(kind) } + " index: " + std::to_string(index) };
}

// Lengths above what the storage can address are argument errors, not allocation failures.
void rejectOversized(Kind kind, std::uint64_t length)
{
    if (length <= bytekit::security::ByteStorage::maxCapacity())
    {
        return;
    }
    bytekit::log::logger()->debug("{}: rejected length {}", kindName(kind), length);
    throw InvalidArgument{ std::string{ kindName(kind) } + " length " + std::to_string(length) + " exceeds " +
                           std::to_string(bytekit::security::ByteStorage::maxCapacity()) };
}

void logReallocation(Kind kind, std::optional<std::size_t> capacity)
{
    if (capacity.has_value())
    {
        bytekit::log::logger()->debug("{}: storage reallocated to {} bytes", kindName(kind), *capacity);
    }
}

void addPattern(std::vector<Pattern>& out, const Value& value)
{
    if (const auto n{ value.toInteger() }; n.has_value())
    {
        out.push_back(Pattern{ lowByte(*n) });
        return;
    }
    if (const auto b{ value.binary() }; b != nullptr)
    {
        out.push_back(b->asRawBytes());
        return;
    }
    if (const auto* raw{ value.bytes() }; raw != nullptr)
    {
        out.push_back(*raw);
        return;
    }
    throw InvalidArgument{ "unsupported delimiter: " + value.describe() };
}

[[nodiscard]] std::vector<Pattern> delimiterPatterns(const Value& delimiter)
{
    std::vector<Pattern> out{};
    if (const auto* seq{ delimiter.sequence() }; seq != nullptr)
    {
        out.reserve(seq->size());
        for (const auto& v : *seq)
        {
            addPattern(out, v);
        }
        return out;
    }
    addPattern(out, delimiter);
    return out;
}

// First candidate that matches at `at`. Empty patterns never match.
[[nodiscard]] const Pattern* matchAt(std::span<const std::uint8_t> bytes, std::size_t at,
                                     const std::vector<Pattern>& patterns) noexcept
{
    for (const auto& p : patterns)
    {
        if (p.empty() || p.size() > bytes.size() - at)
        {
            continue;
        }
        if (std::equal(p.begin(), p.end(), bytes.begin() + static_cast<std::ptrdiff_t>(at)))
        {
            return &p;
        }
    }
    return nullptr;
}

} // namespace

std::string_view kindName(Kind kind) noexcept
{
    switch (kind)
    {
    case Kind::Binary:
        return "Binary";
    case Kind::ByteArray:
        return "ByteArray";
    case Kind::ByteString:
        return "ByteString";
    }
    return "Binary";
}

Binary::Binary(Token, Kind kind, bytekit::security::ByteStorage storage, std::size_t length, bool prototype) noexcept
    : m_kind{ kind }, m_prototype{ prototype }, m_storage{ std::move(storage) }, m_length{ length }
{
}

std::optional<std::uint8_t> Binary::get(Index index) const
{
    const std::shared_lock lock{ m_mutex };
    const auto i{ inBounds(index, m_length) };
    if (!i.has_value())
    {
        return std::nullopt;
    }
    return m_storage[*i];
}

std::optional<std::uint8_t> Binary::charCodeAt(Index index) const
{
    return get(index);
}

bool Binary::has(Index index) const
{
    const std::shared_lock lock{ m_mutex };
    return inBounds(index, m_length).has_value();
}

void Binary::set(Index index, std::int64_t value)
{
    if (!isMutable())
    {
        return;
    }
    requireStorage("set");
    rejectNegativeIndex(m_kind, index);
    rejectOversized(m_kind, static_cast<std::uint64_t>(index) + 1U);

    std::optional<std::size_t> grown{};
    {
        const std::unique_lock lock{ m_mutex };
        const auto i{ static_cast<std::size_t>(index) };
        if (i >= m_length)
        {
            grown = resizeLocked(i + 1U);
        }
        m_storage[i] = lowByte(value);
    }
    logReallocation(m_kind, grown);
}

void Binary::put(Index index, const Value& value)
{
    if (!isMutable())
    {
        return;
    }
    rejectNegativeIndex(m_kind, index);
    const auto n{ value.toInteger() };
    if (!n.has_value())
    {
        bytekit::log::logger()->debug("{}: rejected member {}", kindName(m_kind), value.describe());
        throw InvalidArgument{ "non-numeric " + std::string{ kindName(m_kind) } + " member: " + value.describe() };
    }
    set(index, *n);
}

std::size_t Binary::length() const
{
    const std::shared_lock lock{ m_mutex };
    return m_length;
}

std::size_t Binary::capacity() const
{
    const std::shared_lock lock{ m_mutex };
    return m_storage.size();
}

std::size_t Binary::reallocationCount() const
{
    const std::shared_lock lock{ m_mutex };
    return m_reallocations;
}

void Binary::setLength(Index length)
{
    if (length < 0)
    {
        throw InvalidArgument{ "inappropriate " + std::string{ kindName(m_kind) } +
                               " length: " + std::to_string(length) };
    }
    if (!isMutable())
    {
        return;
    }
    requireStorage("setLength");
    rejectOversized(m_kind, static_cast<std::uint64_t>(length));

    std::optional<std::size_t> grown{};
    {
        const std::unique_lock lock{ m_mutex };
        grown = resizeLocked(static_cast<std::size_t>(length));
    }
    logReallocation(m_kind, grown);
}

void Binary::setLength(const Value& length)
{
    const auto n{ length.toInteger() };
    const auto* real{ length.real() };
    if (!n.has_value() || (real != nullptr && (!std::isfinite(*real) || std::trunc(*real) != *real)))
    {
        throw InvalidArgument{ "inappropriate " + std::string{ kindName(m_kind) } + " length: " + length.describe() };
    }
    setLength(*n);
}

void Binary::ensureLength(std::size_t minLength)
{
    if (!isMutable())
    {
        return;
    }
    requireStorage("ensureLength");
    rejectOversized(m_kind, minLength);

    std::optional<std::size_t> grown{};
    {
        const std::unique_lock lock{ m_mutex };
        if (minLength > m_length)
        {
            grown = resizeLocked(minLength);
        }
    }
    logReallocation(m_kind, grown);
}

BinaryPtr Binary::byteAt(Index index) const
{
    const std::shared_lock lock{ m_mutex };
    const auto i{ inBounds(index, m_length) };
    if (!i.has_value())
    {
        return blank(m_kind);
    }
    return copyBytes(m_kind, bytekit::security::asSpan(m_storage).subspan(*i, 1U));
}

BinaryPtr Binary::charAt(Index index) const
{
    return byteAt(index);
}

BinaryPtr Binary::toMutable(Charset from, Charset to) const
{
    return convert(Kind::ByteArray, from, to);
}

BinaryPtr Binary::toImmutable(Charset from, Charset to)
{
    if (m_kind == Kind::ByteString && !from.has_value() && !to.has_value())
    {
        return shared_from_this();
    }
    return convert(Kind::ByteString, from, to);
}

std::string Binary::decodeToText(Charset charset) const
{
    const auto bytes{ snapshot() };
    if (charset.has_value())
    {
        return bytekit::charset::decode(bytes, *charset);
    }
    return bytekit::charset::decode(bytes, activeConfig().defaultCharset);
}

std::vector<std::uint32_t> Binary::toElementSequence(Charset charset) const
{
    const auto bytes{ snapshot() };
    if (!charset.has_value())
    {
        return std::vector<std::uint32_t>(bytes.begin(), bytes.end());
    }
    const auto codePoints{ bytekit::charset::decodeCodePoints(bytes, *charset) };
    return std::vector<std::uint32_t>(codePoints.begin(), codePoints.end());
}

BinaryPtr Binary::slice(std::optional<Index> begin, std::optional<Index> end) const
{
    const std::shared_lock lock{ m_mutex };
    const auto all{ bytekit::security::asSpan(m_storage).first(m_length) };
    if (!begin.has_value() && !end.has_value())
    {
        return copyBytes(m_kind, all);
    }

    const auto length{ static_cast<Index>(m_length) };
    Index from{ begin.value_or(0) };
    if (from < 0)
    {
        from += length;
    }
    from = std::min(length, std::max(Index{ 0 }, from));

    Index to{ end.value_or(length) };
    if (to < 0)
    {
        to += length;
    }

    const Index count{ std::max(Index{ 0 }, std::min(length - from, to - from)) };
    return copyBytes(m_kind, all.subspan(static_cast<std::size_t>(from), static_cast<std::size_t>(count)));
}

BinaryPtr Binary::concat(std::span<const Value> others) const
{
    std::vector<std::vector<std::uint8_t>> parts{};
    std::size_t extra{ 0U };
    for (const auto& v : others)
    {
        if (const auto b{ v.binary() }; b != nullptr)
        {
            parts.push_back(b->snapshot());
            extra += parts.back().size();
        }
    }

    const std::shared_lock lock{ m_mutex };
    const std::size_t total{ m_length + extra };
    bytekit::security::ByteStorage out(total);
    if (m_length != 0U)
    {
        std::memcpy(out.data(), m_storage.data(), m_length);
    }
    std::size_t at{ m_length };
    for (const auto& p : parts)
    {
        if (!p.empty())
        {
            std::memcpy(out.data() + at, p.data(), p.size());
            at += p.size();
        }
    }
    return adopt(m_kind, std::move(out), total);
}

BinaryPtr Binary::concat(std::initializer_list<Value> others) const
{
    return concat(std::span<const Value>{ others.begin(), others.size() });
}

Index Binary::indexOf(std::int64_t byte, std::optional<Index> from, std::optional<Index> to) const
{
    const std::shared_lock lock{ m_mutex };
    const auto length{ static_cast<Index>(m_length) };
    const Index start{ clampIndex(from.value_or(0), 0, length - 1) };
    const Index end{ clampIndex(to.value_or(length), 0, length) };
    const auto b{ lowByte(byte) };
    for (Index i{ start }; i < end; ++i)
    {
        if (m_storage[static_cast<std::size_t>(i)] == b)
        {
            return i;
        }
    }
    return g_kNotFound;
}

Index Binary::lastIndexOf(std::int64_t byte, std::optional<Index> from, std::optional<Index> to) const
{
    const std::shared_lock lock{ m_mutex };
    const auto length{ static_cast<Index>(m_length) };
    const Index start{ clampIndex(from.value_or(0), 0, length - 1) };
    const Index end{ clampIndex(to.value_or(length), 0, length) };
    const auto b{ lowByte(byte) };
    for (Index i{ end - 1 }; i >= start; --i)
    {
        if (m_storage[static_cast<std::size_t>(i)] == b)
        {
            return i;
        }
    }
    return g_kNotFound;
}

std::vector<BinaryPtr> Binary::split(const Value& delimiter, SplitOptions options)
{
    // Patterns first: a delimiter may be this very instance.
    const auto patterns{ delimiterPatterns(delimiter) };
    const auto bytes{ snapshot() };
    const std::span<const std::uint8_t> all{ bytes };

    std::vector<BinaryPtr> parts{};
    std::size_t cut{ 0U };
    std::size_t cuts{ 0U };
    std::size_t i{ 0U };
    while (i < all.size())
    {
        const Pattern* matched{ matchAt(all, i, patterns) };
        if (matched == nullptr)
        {
            ++i;
            continue;
        }
        parts.push_back(copyBytes(m_kind, all.subspan(cut, i - cut)));
        if (options.includeDelimiter)
        {
            parts.push_back(copyBytes(m_kind, *matched));
        }
        i += matched->size();
        cut = i;
        ++cuts;
    }

    if (cuts == 0U)
    {
        parts.push_back(shared_from_this());
    }
    else
    {
        parts.push_back(copyBytes(m_kind, all.subspan(cut)));
    }
    return parts;
}

std::string Binary::toString() const
{
    if (m_prototype)
    {
        return "[object " + std::string{ kindName(m_kind) } + "]";
    }
    const std::shared_lock lock{ m_mutex };
    return "[" + std::string{ kindName(m_kind) } + " " + std::to_string(m_length) + "]";
}

std::vector<std::uint8_t> Binary::asRawBytes()
{
    std::optional<std::size_t> trimmed{};
    std::vector<std::uint8_t> out{};
    {
        const std::unique_lock lock{ m_mutex };
        trimmed = normalizeLocked();
        out.assign(m_storage.begin(), m_storage.begin() + static_cast<std::ptrdiff_t>(m_length));
    }
    logReallocation(m_kind, trimmed);
    return out;
}

std::vector<std::uint8_t> Binary::unwrap()
{
    return asRawBytes();
}

std::vector<std::uint8_t> Binary::snapshot() const
{
    const std::shared_lock lock{ m_mutex };
    return std::vector<std::uint8_t>(m_storage.begin(), m_storage.begin() + static_cast<std::ptrdiff_t>(m_length));
}

std::optional<std::size_t> Binary::resizeLocked(std::size_t newLength)
{
    std::optional<std::size_t> grown{};
    if (newLength < m_length)
    {
        m_storage.wipe(newLength, m_length);
    }
    else if (newLength > m_storage.size())
    {
        constexpr std::size_t kMaxDoubling{ bytekit::security::ByteStorage::maxCapacity() / 2U };
        const std::size_t doubled{ std::min(m_storage.size(), kMaxDoubling) * 2U };
        const std::size_t next{ std::max(newLength, doubled) };
        bytekit::security::reallocateStorage(m_storage, m_length, next);
        ++m_reallocations;
        grown = next;
    }
    m_length = newLength;
    return grown;
}

std::optional<std::size_t> Binary::normalizeLocked()
{
    if (m_storage.size() == m_length)
    {
        return std::nullopt;
    }
    bytekit::security::reallocateStorage(m_storage, m_length, m_length);
    ++m_reallocations;
    return m_length;
}

void Binary::requireStorage(std::string_view operation) const
{
    if (m_prototype)
    {
        throw TypeError{ std::string{ operation } + " called on the " + std::string{ kindName(m_kind) } +
                         " prototype" };
    }
}

BinaryPtr Binary::convert(Kind target, Charset from, Charset to) const
{
    if (from.has_value() != to.has_value())
    {
        throw InvalidArgument{ "charset conversion needs both a source and a target charset" };
    }
    const auto bytes{ snapshot() };
    if (!from.has_value())
    {
        return copyBytes(target, bytes);
    }
    return copyBytes(target, bytekit::charset::transcode(bytes, *from, *to));
}

} // namespace bytekit::core
