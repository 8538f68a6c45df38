#include "bytekit/core/Binary.hpp"
#include "bytekit/charset/Charset.hpp"
#include "bytekit/core/BinaryErrors.hpp"
#include "bytekit/core/Config.hpp"
#include "bytekit/io/IByteSource.hpp"
#include "bytekit/io/ScopeClose.hpp"
#include "bytekit/log/Log.hpp"
#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace bytekit::core
{
namespace
{

// Sized buffers keep at least this much capacity so the first few writes do not reallocate.
constexpr std::size_t g_kMinSizedCapacity{ 8U };
constexpr std::size_t g_kMaxConstructArgs{ 2U };

void requireConcrete(Kind kind)
{
    if (kind == Kind::Binary)
    {
        throw TypeError{ "cannot instantiate Binary base class" };
    }
}

[[noreturn]] void reject(Kind kind, const std::string& message)
{
    bytekit::log::logger()->debug("{}: construction rejected: {}", kindName(kind), message);
    throw InvalidArgument{ message };
}

} // namespace

BinaryPtr Binary::construct(Kind kind, std::span<const Value> args)
{
    requireConcrete(kind);
    if (args.size() > g_kMaxConstructArgs)
    {
        reject(kind, "expected at most 2 arguments, got " + std::to_string(args.size()));
    }
    if (args.empty())
    {
        return empty(kind);
    }

    const Value& arg{ args[0] };
    if (args.size() == g_kMaxConstructArgs)
    {
        const auto* text{ arg.text() };
        if (text == nullptr)
        {
            reject(kind, "expected string as first argument, got " + arg.describe());
        }
        const auto* charset{ args[1].text() };
        if (charset == nullptr)
        {
            reject(kind, "expected string as second argument, got " + args[1].describe());
        }
        return fromText(kind, *text, *charset);
    }

    switch (arg.kind())
    {
    case ValueKind::Undefined:
        return empty(kind);
    case ValueKind::Integer:
    case ValueKind::Real:
        if (kind == Kind::ByteArray)
        {
            return ofSize(kind, *arg.toInteger());
        }
        break;
    case ValueKind::Sequence:
        return fromElements(kind, *arg.sequence());
    case ValueKind::Bytes:
        return fromBytes(kind, *arg.bytes());
    case ValueKind::Binary:
        if (const auto other{ arg.binary() }; other != nullptr)
        {
            return copyOf(kind, *other);
        }
        break;
    case ValueKind::Source:
        if (const auto source{ arg.source() }; source != nullptr)
        {
            return fromSource(kind, *source);
        }
        break;
    case ValueKind::Text:
        break;
    }
    reject(kind, "unsupported argument: " + arg.describe());
}

BinaryPtr Binary::construct(Kind kind, std::initializer_list<Value> args)
{
    return construct(kind, std::span<const Value>{ args.begin(), args.size() });
}

BinaryPtr Binary::empty(Kind kind)
{
    requireConcrete(kind);
    return blank(kind);
}

BinaryPtr Binary::ofSize(Kind kind, Index size)
{
    requireConcrete(kind);
    if (kind != Kind::ByteArray)
    {
        reject(kind, "a " + std::string{ kindName(kind) } + " cannot be constructed from a size");
    }
    if (size < 0)
    {
        reject(kind, "negative size: " + std::to_string(size));
    }
    if (static_cast<std::uint64_t>(size) > bytekit::security::ByteStorage::maxCapacity())
    {
        reject(kind, "size " + std::to_string(size) + " exceeds " +
                         std::to_string(bytekit::security::ByteStorage::maxCapacity()));
    }
    const auto n{ static_cast<std::size_t>(size) };
    return adopt(kind, bytekit::security::makeStorage({}, std::max(n, g_kMinSizedCapacity)), n);
}

BinaryPtr Binary::fromBytes(Kind kind, std::span<const std::uint8_t> bytes)
{
    requireConcrete(kind);
    return copyBytes(kind, bytes);
}

BinaryPtr Binary::fromBytes(Kind kind, std::span<const std::uint8_t> bytes, std::size_t offset, std::size_t length)
{
    requireConcrete(kind);
    if (offset > bytes.size() || length > bytes.size() - offset)
    {
        reject(kind, "range [" + std::to_string(offset) + ", +" + std::to_string(length) + ") exceeds " +
                         std::to_string(bytes.size()) + " bytes");
    }
    return copyBytes(kind, bytes.subspan(offset, length));
}

BinaryPtr Binary::fromText(Kind kind, std::string_view text, std::string_view charset)
{
    requireConcrete(kind);
    return copyBytes(kind, bytekit::charset::encode(text, charset));
}

BinaryPtr Binary::fromElements(Kind kind, std::span<const Value> elements)
{
    requireConcrete(kind);
    const std::size_t n{ elements.size() };
    auto storage{ bytekit::security::makeStorage({}, std::max(n, g_kMinSizedCapacity)) };
    for (std::size_t i{}; i < n; ++i)
    {
        const auto value{ elements[i].toInteger() };
        if (!value.has_value())
        {
            reject(kind, "non-numeric " + std::string{ kindName(kind) } + " member: " + elements[i].describe());
        }
        storage[i] = static_cast<std::uint8_t>(static_cast<std::uint64_t>(*value) & 0xFFU);
    }
    return adopt(kind, std::move(storage), n);
}

BinaryPtr Binary::fromSource(Kind kind, bytekit::io::IByteSource& source)
{
    auto guard{ bytekit::io::scopeClose(source) };
    requireConcrete(kind);

    const std::size_t chunk{ std::max<std::size_t>(activeConfig().streamChunkBytes, 1U) };
    bytekit::security::ByteStorage buffer(chunk);
    std::size_t count{ 0U };
    for (;;)
    {
        std::size_t got{ 0U };
        try
        {
            const auto room{ bytekit::security::asSpan(buffer).subspan(count) };
            got = source.read(room);
            if (got > room.size())
            {
                throw std::length_error{ "byte source reported more bytes than requested" };
            }
        }
        catch (const std::exception& e)
        {
            guard.closeNow();
            bytekit::log::logger()->error("{}: reading byte source failed after {} bytes: {}", kindName(kind), count,
                                          e.what());
            throw IoFailure{ "error initializing " + std::string{ kindName(kind) } + " from byte source: " + e.what(),
                             std::current_exception() };
        }
        if (got == 0U)
        {
            break;
        }
        count += got;
        if (count == buffer.size())
        {
            bytekit::security::reallocateStorage(buffer, count, buffer.size() * 2U);
        }
    }
    guard.closeNow();

    const auto read{ bytekit::security::asSpan(buffer).first(count) };
    return adopt(kind, bytekit::security::makeStorage(read, count), count);
}

BinaryPtr Binary::copyOf(Kind kind, const Binary& other)
{
    requireConcrete(kind);
    return copyBytes(kind, other.snapshot());
}

BinaryPtr Binary::prototype(Kind kind)
{
    return std::make_shared<Binary>(Token{}, kind, bytekit::security::ByteStorage{}, 0U, true);
}

BinaryPtr Binary::adopt(Kind kind, bytekit::security::ByteStorage storage, std::size_t length)
{
    return std::make_shared<Binary>(Token{}, kind, std::move(storage), length, false);
}

BinaryPtr Binary::copyBytes(Kind kind, std::span<const std::uint8_t> bytes)
{
    return adopt(kind, bytekit::security::makeStorage(bytes, bytes.size()), bytes.size());
}

BinaryPtr Binary::blank(Kind kind)
{
    return adopt(kind, bytekit::security::makeStorage({}, g_kMinSizedCapacity), 0U);
}

} // namespace bytekit::core
