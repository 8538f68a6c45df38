#include "bytekit/core/Config.hpp"

#include "bytekit/log/Log.hpp"
#include <charconv>
#include <cstdlib>
#include <mutex>
#include <system_error>
#include <utility>

namespace bytekit::core
{
namespace
{

struct ConfigSlot final
{
    std::mutex mutex;
    Config config{ configFromEnvironment() };
};

ConfigSlot& slot()
{
    static ConfigSlot instance{};
    return instance;
}

[[nodiscard]] std::optional<std::size_t> parseSize(std::string_view text) noexcept
{
    std::size_t value{};
    const char* first{ text.data() };
    const char* last{ text.data() + text.size() };
    const auto [ptr, ec]{ std::from_chars(first, last, value) };
    if (ec != std::errc{} || ptr != last)
    {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::optional<std::string> getEnv(std::string_view name)
{
    if (name.empty())
    {
        return std::nullopt;
    }
    const char* value{ std::getenv(std::string{ name }.c_str()) };
    if (value == nullptr)
    {
        return std::nullopt;
    }
    return std::string{ value };
}

Config configFromEnvironment()
{
    Config config{};

    if (const auto charset{ getEnv(g_kEnvDefaultCharset) }; charset.has_value() && !charset->empty())
    {
        config.defaultCharset = *charset;
    }

    if (const auto chunk{ getEnv(g_kEnvStreamChunkBytes) }; chunk.has_value())
    {
        if (const auto parsed{ parseSize(*chunk) }; parsed.has_value() && *parsed > 0U)
        {
            config.streamChunkBytes = *parsed;
        }
    }

    if (const auto level{ getEnv(g_kEnvLogLevel) }; level.has_value() && !level->empty())
    {
        // from_str maps unknown names to off; only accept names that round-trip.
        const auto parsed{ spdlog::level::from_str(*level) };
        if (parsed != spdlog::level::off || *level == "off")
        {
            config.logLevel = parsed;
        }
    }

    return config;
}

Config activeConfig()
{
    auto& s{ slot() };
    const std::scoped_lock lock{ s.mutex };
    return s.config;
}

void setActiveConfig(Config config)
{
    if (config.streamChunkBytes == 0U)
    {
        config.streamChunkBytes = g_kDefaultStreamChunkBytes;
    }
    if (config.defaultCharset.empty())
    {
        config.defaultCharset = std::string{ g_kDefaultCharset };
    }

    const auto level{ config.logLevel };
    {
        auto& s{ slot() };
        const std::scoped_lock lock{ s.mutex };
        s.config = std::move(config);
    }
    bytekit::log::applyLevel(level);
}

} // namespace bytekit::core
