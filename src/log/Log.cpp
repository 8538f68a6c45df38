#include "bytekit/log/Log.hpp"

#include "bytekit/core/Config.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace bytekit::log
{
namespace
{

std::shared_ptr<spdlog::logger> makeLogger()
{
    if (auto existing{ spdlog::get(std::string{ g_kLoggerName }) }; existing != nullptr)
    {
        return existing;
    }

    auto sink{ std::make_shared<spdlog::sinks::stderr_color_sink_mt>() };
    auto created{ std::make_shared<spdlog::logger>(std::string{ g_kLoggerName }, sink) };
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    created->set_level(bytekit::core::activeConfig().logLevel);
    spdlog::register_logger(created);
    return created;
}

} // namespace

std::shared_ptr<spdlog::logger> logger()
{
    static const std::shared_ptr<spdlog::logger> instance{ makeLogger() };
    return instance;
}

void applyLevel(spdlog::level::level_enum level)
{
    logger()->set_level(level);
}

} // namespace bytekit::log
