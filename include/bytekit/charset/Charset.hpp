#ifndef INCLUDE_BYTEKIT_CHARSET_CHARSET_HPP
#define INCLUDE_BYTEKIT_CHARSET_CHARSET_HPP

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Conversions between raw bytes in a named charset and UTF-8 text.
//
// Charset names are whatever the platform converter accepts ("UTF-8", "ISO-8859-1", "UTF-16BE",
// "windows-1252", ...). Unknown names raise core::UnsupportedEncoding. Content never fails a
// conversion: malformed input decodes to U+FFFD and unmappable characters encode as '?'.
namespace bytekit::charset
{

[[nodiscard]] bool isSupported(std::string_view charset);

// Bytes in `charset` to UTF-8 text.
[[nodiscard]] std::string decode(std::span<const std::uint8_t> bytes, std::string_view charset);

// UTF-8 text to bytes in `charset`.
[[nodiscard]] std::vector<std::uint8_t> encode(std::string_view text, std::string_view charset);

// Bytes in `from` to bytes in `to`, going through text.
[[nodiscard]] std::vector<std::uint8_t> transcode(std::span<const std::uint8_t> bytes, std::string_view from,
                                                  std::string_view to);

// Bytes in `charset` to Unicode code points.
[[nodiscard]] std::u32string decodeCodePoints(std::span<const std::uint8_t> bytes, std::string_view charset);

} // namespace bytekit::charset

#endif // INCLUDE_BYTEKIT_CHARSET_CHARSET_HPP
