#ifndef INCLUDE_BYTEKIT_CORE_BINARY_HPP
#define INCLUDE_BYTEKIT_CORE_BINARY_HPP

#include "bytekit/core/Value.hpp"
#include "bytekit/security/ByteStorage.hpp"
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bytekit::io
{
class IByteSource;
} // namespace bytekit::io

namespace bytekit::core
{

// Binary is the abstract base; only prototypes carry it.
enum class Kind : std::uint8_t
{
    Binary,
    ByteArray,
    ByteString,
};

[[nodiscard]] std::string_view kindName(Kind kind) noexcept;

using Index = std::int64_t;
constexpr Index g_kNotFound{ -1 };

struct SplitOptions final
{
    // Emit each matched delimiter as its own element between the segments.
    bool includeDelimiter{ false };
};

using Charset = std::optional<std::string_view>;

/**
 * @brief Byte buffer shared by the ByteArray (mutable, resizable) and ByteString (immutable) kinds.
 *
 * Instances are always handled through BinaryPtr; two handles are equal only when they refer to
 * the same instance. Every instance owns its storage exclusively: construction, slicing and
 * conversion copy bytes, never share them.
 *
 * Thread-safety: all members may be called concurrently. Reads take the instance lock shared,
 * writes take it exclusively, and no operation holds the locks of two instances at once.
 *
 * ByteString instances ignore writes (set, put, setLength, ensureLength are no-ops) instead of
 * failing, so code written against ByteArray degrades to read-only behaviour.
 */
class Binary final : public std::enable_shared_from_this<Binary>
{
    struct Token
    {
        explicit Token() = default;
    };

public:
    // Use the factories; the token keeps the constructor out of reach while allowing make_shared.
    Binary(Token, Kind kind, bytekit::security::ByteStorage storage, std::size_t length, bool prototype) noexcept;

    Binary(const Binary&) = delete;
    Binary& operator=(const Binary&) = delete;
    Binary(Binary&&) = delete;
    Binary& operator=(Binary&&) = delete;
    ~Binary() = default;

    // Generic entry point for 0, 1 or 2 loosely typed constructor arguments:
    //   ()                     empty buffer
    //   (undefined)            empty buffer
    //   (number)               that many zero bytes; ByteArray only
    //   (sequence of numbers)  byte i = element i & 0xFF
    //   (bytes)                copy
    //   (binary)               copy
    //   (source)               everything up to end of stream; the source is closed afterwards
    //   (text, charset)        text encoded in charset
    // Throws TypeError for Kind::Binary, InvalidArgument for any other shape.
    [[nodiscard]] static BinaryPtr construct(Kind kind, std::span<const Value> args);
    [[nodiscard]] static BinaryPtr construct(Kind kind, std::initializer_list<Value> args);

    [[nodiscard]] static BinaryPtr empty(Kind kind);
    [[nodiscard]] static BinaryPtr ofSize(Kind kind, Index size);
    [[nodiscard]] static BinaryPtr fromBytes(Kind kind, std::span<const std::uint8_t> bytes);
    [[nodiscard]] static BinaryPtr fromBytes(Kind kind, std::span<const std::uint8_t> bytes, std::size_t offset,
                                             std::size_t length);
    [[nodiscard]] static BinaryPtr fromText(Kind kind, std::string_view text, std::string_view charset);
    [[nodiscard]] static BinaryPtr fromElements(Kind kind, std::span<const Value> elements);
    // Throws IoFailure if the source fails; the source is closed on every path.
    [[nodiscard]] static BinaryPtr fromSource(Kind kind, bytekit::io::IByteSource& source);
    [[nodiscard]] static BinaryPtr copyOf(Kind kind, const Binary& other);

    // Storage-less instance standing for the prototype of `kind`.
    [[nodiscard]] static BinaryPtr prototype(Kind kind);

    [[nodiscard]] Kind kind() const noexcept
    {
        return m_kind;
    }

    [[nodiscard]] bool isMutable() const noexcept
    {
        return m_kind == Kind::ByteArray;
    }

    [[nodiscard]] bool isPrototype() const noexcept
    {
        return m_prototype;
    }

    [[nodiscard]] std::string_view className() const noexcept
    {
        return kindName(m_kind);
    }

    // Byte at `index`, or nullopt outside [0, length).
    [[nodiscard]] std::optional<std::uint8_t> get(Index index) const;
    [[nodiscard]] std::optional<std::uint8_t> charCodeAt(Index index) const;
    [[nodiscard]] bool has(Index index) const;

    // Stores value & 0xFF, growing the buffer to index + 1 first if needed.
    void set(Index index, std::int64_t value);
    // Like set, but rejects non-numeric values.
    void put(Index index, const Value& value);

    [[nodiscard]] std::size_t length() const;
    [[nodiscard]] std::size_t capacity() const;
    [[nodiscard]] std::size_t reallocationCount() const;

    void setLength(Index length);
    // Accepts only integral, non-negative numbers.
    void setLength(const Value& length);
    void ensureLength(std::size_t minLength);

    // One-byte buffer of the same kind, or an empty one when out of range.
    [[nodiscard]] BinaryPtr byteAt(Index index) const;
    [[nodiscard]] BinaryPtr charAt(Index index) const;

    // Without charsets: a copy of the bytes. With both: the bytes decoded from `from` and
    // re-encoded in `to`. Giving just one is an InvalidArgument.
    [[nodiscard]] BinaryPtr toMutable(Charset from = std::nullopt, Charset to = std::nullopt) const;
    // A ByteString receiver without charsets is returned as is.
    [[nodiscard]] BinaryPtr toImmutable(Charset from = std::nullopt, Charset to = std::nullopt);

    // UTF-8 text; `charset` defaults to the configured default charset.
    [[nodiscard]] std::string decodeToText(Charset charset = std::nullopt) const;
    // Without a charset one element per byte, otherwise one Unicode code point per character.
    [[nodiscard]] std::vector<std::uint32_t> toElementSequence(Charset charset = std::nullopt) const;

    [[nodiscard]] BinaryPtr slice(std::optional<Index> begin = std::nullopt,
                                  std::optional<Index> end = std::nullopt) const;
    // Arguments that are not binaries are skipped.
    [[nodiscard]] BinaryPtr concat(std::span<const Value> others) const;
    [[nodiscard]] BinaryPtr concat(std::initializer_list<Value> others) const;

    [[nodiscard]] Index indexOf(std::int64_t byte, std::optional<Index> from = std::nullopt,
                                std::optional<Index> to = std::nullopt) const;
    [[nodiscard]] Index lastIndexOf(std::int64_t byte, std::optional<Index> from = std::nullopt,
                                    std::optional<Index> to = std::nullopt) const;

    // `delimiter` is a byte value, a binary, raw bytes, or a sequence of those. At each position
    // the candidates are tried in order and the first match cuts. Without any cut the result is
    // this instance alone.
    [[nodiscard]] std::vector<BinaryPtr> split(const Value& delimiter, SplitOptions options = {});

    [[nodiscard]] std::string toString() const;

    // Trims the storage to the logical length and returns a copy of the bytes.
    [[nodiscard]] std::vector<std::uint8_t> asRawBytes();
    [[nodiscard]] std::vector<std::uint8_t> unwrap();

private:
    [[nodiscard]] static BinaryPtr adopt(Kind kind, bytekit::security::ByteStorage storage, std::size_t length);
    [[nodiscard]] static BinaryPtr copyBytes(Kind kind, std::span<const std::uint8_t> bytes);
    // Empty instance of any kind, including the base kind.
    [[nodiscard]] static BinaryPtr blank(Kind kind);

    // Copy of the bytes in [0, length), taken under the shared lock.
    [[nodiscard]] std::vector<std::uint8_t> snapshot() const;

    // Both require the exclusive lock. They return the new capacity when the storage was
    // reallocated, so the caller can log it once the lock is released.
    [[nodiscard]] std::optional<std::size_t> resizeLocked(std::size_t newLength);
    [[nodiscard]] std::optional<std::size_t> normalizeLocked();

    void requireStorage(std::string_view operation) const;
    [[nodiscard]] BinaryPtr convert(Kind target, Charset from, Charset to) const;

    const Kind m_kind;
    const bool m_prototype;
    mutable std::shared_mutex m_mutex;
    bytekit::security::ByteStorage m_storage;
    std::size_t m_length{ 0U };
    std::size_t m_reallocations{ 0U };
};

} // namespace bytekit::core

#endif // INCLUDE_BYTEKIT_CORE_BINARY_HPP
