#include "gtest/gtest.h"

#include <cstdlib>
#include <stdexcept>

#include "ConfigurationManager.hpp"

namespace {

struct ScopedEnv
{
    char const* name;

    ScopedEnv(char const* name, char const* value) : name(name) { setenv(name, value, 1); }
    ~ScopedEnv() { unsetenv(name); }
};

}  // namespace

TEST(configuration, defaults)
{
    unsetenv("TRAIN_LOCATOR_DB");
    unsetenv("MAX_DISTANCE_KM");
    unsetenv("TRAIN_LOCATOR_PORT");

    ConfigurationManager config;
    EXPECT_EQ("trainLocator.db", config.getDatabasePath());
    EXPECT_EQ(8080, config.getListenPort());
    EXPECT_DOUBLE_EQ(50.0, config.getMaxDistanceKm());
}

TEST(configuration, environment_overrides)
{
    ScopedEnv db("TRAIN_LOCATOR_DB", "/var/lib/locator/index.db");
    ScopedEnv distance("MAX_DISTANCE_KM", "25.5");
    ScopedEnv timeout("UPSTREAM_TIMEOUT_SEC", "4");

    ConfigurationManager config;
    EXPECT_EQ("/var/lib/locator/index.db", config.getDatabasePath());
    EXPECT_DOUBLE_EQ(25.5, config.getMaxDistanceKm());
    EXPECT_EQ(std::chrono::seconds(4), config.getUpstreamTimeout());

    config.setDatabasePath("other.db");
    EXPECT_EQ("other.db", config.getDatabasePath());
}

TEST(configuration, rejects_bad_numbers)
{
    {
        ScopedEnv port("TRAIN_LOCATOR_PORT", "http");
        EXPECT_THROW(ConfigurationManager(), std::runtime_error);
    }
    {
        ScopedEnv port("TRAIN_LOCATOR_PORT", "70000");
        EXPECT_THROW(ConfigurationManager(), std::runtime_error);
    }
    {
        ScopedEnv distance("MAX_DISTANCE_KM", "-1");
        EXPECT_THROW(ConfigurationManager(), std::runtime_error);
    }
}

TEST(configuration, rejects_unknown_time_zone)
{
    {
        ScopedEnv tz("TRAIN_LOCATOR_TZ", "Bogus/Zone");
        EXPECT_THROW(ConfigurationManager(), std::runtime_error);
    }
    {
        ScopedEnv tz("TRAIN_LOCATOR_TZ", "UTC");
        EXPECT_EQ("UTC", ConfigurationManager().getTimeZone());
    }
}
