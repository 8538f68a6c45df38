#include "bytekit/charset/Charset.hpp"

#include "LittleEndian.hpp"
#include "bytekit/core/BinaryErrors.hpp"
#include "bytekit/log/Log.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <memory>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include <iconv.h>

namespace bytekit::charset
{
namespace
{

constexpr std::string_view g_kUtf8{ "UTF-8" };
constexpr std::string_view g_kUtf32LE{ "UTF-32LE" };

// U+FFFD in the two internal decode targets.
constexpr std::array<std::uint8_t, 3> g_kReplacementUtf8{ 0xEFU, 0xBFU, 0xBDU };
constexpr std::array<std::uint8_t, 4> g_kReplacementUtf32LE{ 0xFDU, 0xFFU, 0x00U, 0x00U };
constexpr std::string_view g_kUnmappable{ "?" };

constexpr std::size_t g_kMinOutBytes{ 16U };
constexpr std::size_t g_kIconvError{ static_cast<std::size_t>(-1) };

struct IconvCloser final
{
    void operator()(void* cd) const noexcept
    {
        if (cd != nullptr)
        {
            (void)::iconv_close(static_cast<iconv_t>(cd));
        }
    }
};

using IconvPtr = std::unique_ptr<void, IconvCloser>;

// How a conversion steps over a malformed or unmappable unit and what it writes in its place.
struct OnMalformed final
{
    // Bytes per code unit of the source charset; 0 skips one UTF-8 sequence instead.
    std::size_t unitBytes;
    // Appended to the output as is.
    std::span<const std::uint8_t> emit;
    // Converted through the same descriptor, so a stateful target (a BOM, a shift state) stays
    // consistent.
    std::span<const std::uint8_t> convert;
};

[[nodiscard]] IconvPtr tryOpen(std::string_view to, std::string_view from)
{
    if (to.empty() || from.empty())
    {
        return IconvPtr{ nullptr };
    }
    const std::string toName{ to };
    const std::string fromName{ from };
    iconv_t cd{ ::iconv_open(toName.c_str(), fromName.c_str()) };
    if (cd == reinterpret_cast<iconv_t>(-1))
    {
        return IconvPtr{ nullptr };
    }
    return IconvPtr{ cd };
}

// `charset` is the caller-supplied name reported if the pair cannot be opened.
[[nodiscard]] IconvPtr openOrThrow(std::string_view to, std::string_view from, std::string_view charset)
{
    IconvPtr cd{ tryOpen(to, from) };
    if (cd == nullptr)
    {
        bytekit::log::logger()->warn("charset: unsupported encoding '{}'", charset);
        throw bytekit::core::UnsupportedEncoding{ std::string{ charset } };
    }
    return cd;
}

// Length of the malformed or unmappable UTF-8 sequence at the front of `in`: the lead byte plus
// the continuation bytes actually present.
[[nodiscard]] std::size_t utf8SkipLength(const std::uint8_t* in, std::size_t available) noexcept
{
    constexpr std::uint8_t kTwoByteLead{ 0xC0U };
    constexpr std::uint8_t kThreeByteLead{ 0xE0U };
    constexpr std::uint8_t kFourByteLead{ 0xF0U };
    constexpr std::uint8_t kInvalidLead{ 0xF8U };
    constexpr std::uint8_t kContinuationMask{ 0xC0U };
    constexpr std::uint8_t kContinuation{ 0x80U };

    const std::uint8_t lead{ in[0] };
    std::size_t expected{ 1U };
    if (lead >= kTwoByteLead && lead < kThreeByteLead)
    {
        expected = 2U;
    }
    else if (lead >= kThreeByteLead && lead < kFourByteLead)
    {
        expected = 3U;
    }
    else if (lead >= kFourByteLead && lead < kInvalidLead)
    {
        expected = 4U;
    }

    std::size_t n{ 1U };
    while (n < expected && n < available && (in[n] & kContinuationMask) == kContinuation)
    {
        ++n;
    }
    return n;
}

[[nodiscard]] std::string upperAscii(std::string_view s)
{
    std::string out{ s };
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>((c >= 'a' && c <= 'z') ? c - ('a' - 'A') : c);
    });
    return out;
}

// Width of one code unit in `charset`: 4 for the UTF-32/UCS-4 family, 2 for UTF-16/UCS-2, 1 for
// everything else.
[[nodiscard]] std::size_t codeUnitBytes(std::string_view charset)
{
    const std::string name{ upperAscii(charset) };
    const auto startsWith{ [&name](std::string_view prefix) { return name.starts_with(prefix); } };
    if (startsWith("UTF-32") || startsWith("UTF32") || startsWith("UCS-4") || startsWith("UCS4"))
    {
        return 4U;
    }
    if (startsWith("UTF-16") || startsWith("UTF16") || startsWith("UCS-2") || startsWith("UCS2") ||
        startsWith("UNICODE"))
    {
        return 2U;
    }
    return 1U;
}

class OutBuffer final
{
public:
    explicit OutBuffer(std::size_t initial) : m_bytes(std::max(initial, g_kMinOutBytes))
    {
    }

    [[nodiscard]] char* cursor() noexcept
    {
        return reinterpret_cast<char*>(m_bytes.data() + m_used);
    }

    [[nodiscard]] std::size_t room() const noexcept
    {
        return m_bytes.size() - m_used;
    }

    void commitRemaining(std::size_t roomLeft) noexcept
    {
        m_used = m_bytes.size() - roomLeft;
    }

    void grow()
    {
        m_bytes.resize(m_bytes.size() * 2U);
    }

    void append(std::span<const std::uint8_t> bytes)
    {
        while (room() < bytes.size())
        {
            grow();
        }
        if (!bytes.empty())
        {
            std::memcpy(m_bytes.data() + m_used, bytes.data(), bytes.size());
            m_used += bytes.size();
        }
    }

    [[nodiscard]] std::vector<std::uint8_t> take()
    {
        m_bytes.resize(m_used);
        return std::move(m_bytes);
    }

private:
    std::vector<std::uint8_t> m_bytes;
    std::size_t m_used{ 0U };
};

// Feeds `inPtr`/`inLeft` through `handle` into `out`, growing it as needed. Returns 0 once the
// input is consumed (or the shift state flushed when `inPtr` is null), otherwise the errno that
// stopped the conversion.
[[nodiscard]] int pump(iconv_t handle, char** inPtr, std::size_t* inLeft, OutBuffer& out)
{
    for (;;)
    {
        char* outPtr{ out.cursor() };
        std::size_t outLeft{ out.room() };
        const std::size_t rc{ ::iconv(handle, inPtr, inLeft, &outPtr, &outLeft) };
        out.commitRemaining(outLeft);
        if (rc != g_kIconvError)
        {
            return 0;
        }
        const int err{ errno };
        if (err != E2BIG)
        {
            return err;
        }
        out.grow();
    }
}

void appendReplacement(iconv_t handle, const OnMalformed& policy, OutBuffer& out)
{
    out.append(policy.emit);
    if (policy.convert.empty())
    {
        return;
    }
    char* inPtr{ const_cast<char*>(reinterpret_cast<const char*>(policy.convert.data())) };
    std::size_t inLeft{ policy.convert.size() };
    // A target that cannot hold the replacement itself gets nothing in its place.
    (void)pump(handle, &inPtr, &inLeft, out);
}

[[nodiscard]] std::vector<std::uint8_t> run(const IconvPtr& cd, std::span<const std::uint8_t> in,
                                            const OnMalformed& policy)
{
    auto* const handle{ static_cast<iconv_t>(cd.get()) };
    OutBuffer out{ in.size() * 2U };

    // glibc's iconv takes a non-const input pointer but never writes through it.
    char* inPtr{ const_cast<char*>(reinterpret_cast<const char*>(in.data())) };
    std::size_t inLeft{ in.size() };

    while (inLeft > 0U)
    {
        const int err{ pump(handle, &inPtr, &inLeft, out) };
        if (err == 0)
        {
            continue;
        }
        if (err == EILSEQ)
        {
            const auto* at{ reinterpret_cast<const std::uint8_t*>(inPtr) };
            const std::size_t unit{ (policy.unitBytes == 0U) ? utf8SkipLength(at, inLeft) : policy.unitBytes };
            const std::size_t skip{ std::min(unit, inLeft) };
            inPtr += skip;
            inLeft -= skip;
            appendReplacement(handle, policy, out);
            continue;
        }
        if (err == EINVAL)
        {
            // Truncated sequence at the end of the input.
            inPtr += inLeft;
            inLeft = 0U;
            appendReplacement(handle, policy, out);
            break;
        }
        throw std::system_error{ err, std::generic_category(), "charset: conversion failed" };
    }

    if (const int err{ pump(handle, nullptr, nullptr, out) }; err != 0)
    {
        throw std::system_error{ err, std::generic_category(), "charset: flush failed" };
    }
    return out.take();
}

[[nodiscard]] std::span<const std::uint8_t> asBytes(std::string_view s) noexcept
{
    return { reinterpret_cast<const std::uint8_t*>(s.data()), s.size() };
}

} // namespace

bool isSupported(std::string_view charset)
{
    return tryOpen(g_kUtf8, charset) != nullptr && tryOpen(charset, g_kUtf8) != nullptr;
}

std::string decode(std::span<const std::uint8_t> bytes, std::string_view charset)
{
    const IconvPtr cd{ openOrThrow(g_kUtf8, charset, charset) };
    const auto utf8{ run(cd, bytes, OnMalformed{ .unitBytes = codeUnitBytes(charset), .emit = g_kReplacementUtf8 }) };
    return std::string{ utf8.begin(), utf8.end() };
}

std::vector<std::uint8_t> encode(std::string_view text, std::string_view charset)
{
    const IconvPtr cd{ openOrThrow(charset, g_kUtf8, charset) };
    return run(cd, asBytes(text), OnMalformed{ .unitBytes = 0U, .convert = asBytes(g_kUnmappable) });
}

std::vector<std::uint8_t> transcode(std::span<const std::uint8_t> bytes, std::string_view from, std::string_view to)
{
    if (!isSupported(to))
    {
        bytekit::log::logger()->warn("charset: unsupported encoding '{}'", to);
        throw bytekit::core::UnsupportedEncoding{ std::string{ to } };
    }
    return encode(decode(bytes, from), to);
}

std::u32string decodeCodePoints(std::span<const std::uint8_t> bytes, std::string_view charset)
{
    const IconvPtr cd{ openOrThrow(g_kUtf32LE, charset, charset) };
    const auto units{ run(cd, bytes,
                          OnMalformed{ .unitBytes = codeUnitBytes(charset), .emit = g_kReplacementUtf32LE }) };

    std::u32string out{};
    out.reserve(units.size() / detail::g_kU32Bytes);
    const std::span<const std::uint8_t> all{ units };
    for (std::size_t i{}; i + detail::g_kU32Bytes <= all.size(); i += detail::g_kU32Bytes)
    {
        const auto unit{ all.subspan(i).first<detail::g_kU32Bytes>() };
        out.push_back(static_cast<char32_t>(detail::readU32LE(unit)));
    }
    return out;
}

} // namespace bytekit::charset
