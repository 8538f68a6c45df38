#ifndef INCLUDE_BYTEKIT_CORE_CONFIG_HPP
#define INCLUDE_BYTEKIT_CORE_CONFIG_HPP

#include <cstddef>
#include <optional>
#include <spdlog/common.h>
#include <string>
#include <string_view>

namespace bytekit::core
{

constexpr std::string_view g_kDefaultCharset{ "UTF-8" };
constexpr std::size_t g_kDefaultStreamChunkBytes{ 1024U };

constexpr std::string_view g_kEnvDefaultCharset{ "BYTEKIT_DEFAULT_CHARSET" };
constexpr std::string_view g_kEnvStreamChunkBytes{ "BYTEKIT_STREAM_CHUNK_BYTES" };
constexpr std::string_view g_kEnvLogLevel{ "BYTEKIT_LOG_LEVEL" };

struct Config final
{
    // Charset used by decodeToText() when none is given.
    std::string defaultCharset{ g_kDefaultCharset };
    // Initial read buffer when constructing from a byte source; doubled whenever it fills up.
    std::size_t streamChunkBytes{ g_kDefaultStreamChunkBytes };
    spdlog::level::level_enum logLevel{ spdlog::level::warn };
};

[[nodiscard]] std::optional<std::string> getEnv(std::string_view name);

// Malformed or empty variables leave the corresponding default in place.
[[nodiscard]] Config configFromEnvironment();

// Process-wide configuration, loaded from the environment on first use.
[[nodiscard]] Config activeConfig();

void setActiveConfig(Config config);

} // namespace bytekit::core

#endif // INCLUDE_BYTEKIT_CORE_CONFIG_HPP
