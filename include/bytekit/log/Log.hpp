#ifndef INCLUDE_BYTEKIT_LOG_LOG_HPP
#define INCLUDE_BYTEKIT_LOG_LOG_HPP

#include <memory>
#include <spdlog/spdlog.h>
#include <string_view>

namespace bytekit::log
{

constexpr std::string_view g_kLoggerName{ "bytekit" };

// Shared "bytekit" logger writing to stderr. Created on first use with the level from
// core::activeConfig().
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

void applyLevel(spdlog::level::level_enum level);

} // namespace bytekit::log

#endif // INCLUDE_BYTEKIT_LOG_LOG_HPP
