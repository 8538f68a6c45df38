#include "bytekit/core/Config.hpp"
#include "bytekit/log/Log.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <utility>

#include <stdlib.h>

namespace
{

// Sets an environment variable for the lifetime of the guard and restores the previous value.
class EnvGuard final
{
public:
    EnvGuard(std::string name, const std::string& value)
        : m_name{ std::move(name) }, m_previous{ bytekit::core::getEnv(m_name) }
    {
        ::setenv(m_name.c_str(), value.c_str(), 1);
    }

    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;
    EnvGuard(EnvGuard&&) = delete;
    EnvGuard& operator=(EnvGuard&&) = delete;

    ~EnvGuard()
    {
        if (m_previous.has_value())
        {
            ::setenv(m_name.c_str(), m_previous->c_str(), 1);
        }
        else
        {
            ::unsetenv(m_name.c_str());
        }
    }

private:
    std::string m_name;
    std::optional<std::string> m_previous;
};

class ActiveConfigTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_saved = bytekit::core::activeConfig();
    }

    void TearDown() override
    {
        bytekit::core::setActiveConfig(m_saved);
    }

private:
    bytekit::core::Config m_saved{};
};

} // namespace

TEST(Config, DefaultsWithoutEnvironment)
{
    const bytekit::core::Config config{};

    EXPECT_EQ(config.defaultCharset, "UTF-8");
    EXPECT_EQ(config.streamChunkBytes, 1024U);
    EXPECT_EQ(config.logLevel, spdlog::level::warn);
}

TEST(Config, ReadsEnvironment)
{
    const EnvGuard charset{ std::string{ bytekit::core::g_kEnvDefaultCharset }, "ISO-8859-1" };
    const EnvGuard chunk{ std::string{ bytekit::core::g_kEnvStreamChunkBytes }, "64" };
    const EnvGuard level{ std::string{ bytekit::core::g_kEnvLogLevel }, "debug" };

    const auto config{ bytekit::core::configFromEnvironment() };

    EXPECT_EQ(config.defaultCharset, "ISO-8859-1");
    EXPECT_EQ(config.streamChunkBytes, 64U);
    EXPECT_EQ(config.logLevel, spdlog::level::debug);
}

TEST(Config, IgnoresMalformedEnvironment)
{
    const EnvGuard charset{ std::string{ bytekit::core::g_kEnvDefaultCharset }, "" };
    const EnvGuard chunk{ std::string{ bytekit::core::g_kEnvStreamChunkBytes }, "12abc" };
    const EnvGuard level{ std::string{ bytekit::core::g_kEnvLogLevel }, "chatty" };

    const auto config{ bytekit::core::configFromEnvironment() };

    EXPECT_EQ(config.defaultCharset, "UTF-8");
    EXPECT_EQ(config.streamChunkBytes, 1024U);
    EXPECT_EQ(config.logLevel, spdlog::level::warn);
}

TEST(Config, ZeroChunkIsIgnored)
{
    const EnvGuard chunk{ std::string{ bytekit::core::g_kEnvStreamChunkBytes }, "0" };
    EXPECT_EQ(bytekit::core::configFromEnvironment().streamChunkBytes, 1024U);
}

TEST(Config, OffIsAValidLevel)
{
    const EnvGuard level{ std::string{ bytekit::core::g_kEnvLogLevel }, "off" };
    EXPECT_EQ(bytekit::core::configFromEnvironment().logLevel, spdlog::level::off);
}

TEST(Config, GetEnvRejectsEmptyName)
{
    EXPECT_FALSE(bytekit::core::getEnv("").has_value());
}

TEST_F(ActiveConfigTest, SetActiveConfigRepairsInvalidFields)
{
    bytekit::core::Config config{};
    config.defaultCharset.clear();
    config.streamChunkBytes = 0U;

    bytekit::core::setActiveConfig(config);
    const auto active{ bytekit::core::activeConfig() };

    EXPECT_EQ(active.defaultCharset, "UTF-8");
    EXPECT_EQ(active.streamChunkBytes, 1024U);
}

TEST_F(ActiveConfigTest, SetActiveConfigAppliesLogLevel)
{
    bytekit::core::Config config{};
    config.logLevel = spdlog::level::debug;

    bytekit::core::setActiveConfig(config);

    EXPECT_EQ(bytekit::log::logger()->level(), spdlog::level::debug);
    EXPECT_EQ(bytekit::log::logger()->name(), "bytekit");
}
