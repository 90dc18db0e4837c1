#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>
#include <date/tz.h>
#include "ConfigurationManager.hpp"

ConfigurationManager::ConfigurationManager()
{
    databasePath = readString("TRAIN_LOCATOR_DB", DEFAULT_DB_PATH);
    apiHost      = readString("TRANSIT_API_HOST", DEFAULT_API_HOST);
    apiPort      = std::to_string(readInteger("TRANSIT_API_PORT", std::stol(DEFAULT_API_PORT), 1, 65535));
    listenPort   = static_cast<std::uint16_t>(readInteger("TRAIN_LOCATOR_PORT", DEFAULT_LISTEN_PORT, 1, 65535));
    maxDistanceKm = readDouble("MAX_DISTANCE_KM", DEFAULT_MAX_DISTANCE_KM);
    upstreamTimeout = std::chrono::seconds(readInteger("UPSTREAM_TIMEOUT_SEC", DEFAULT_UPSTREAM_TIMEOUT_SEC, 1, 300));
    arrivalsDurationMin = static_cast<int>(readInteger("ARRIVALS_DURATION_MIN", DEFAULT_ARRIVALS_DURATION_MIN, 1, 720));
    timeZone     = readString("TRAIN_LOCATOR_TZ", DEFAULT_TIME_ZONE);

    if (maxDistanceKm <= 0.0)
        throw std::runtime_error("MAX_DISTANCE_KM must be positive.");

    try
    {
        date::locate_zone(timeZone);
    }
    catch (std::exception const& e)
    {
        throw std::runtime_error("TRAIN_LOCATOR_TZ '" + timeZone + "' is not a known time zone: " + e.what());
    }
}

std::string ConfigurationManager::readString(char const* name, std::string const& fallback)
{
    const char* value = std::getenv(name);
    if (!value || !*value) return fallback;
    return value;
}

long ConfigurationManager::readInteger(char const* name, long fallback, long min, long max)
{
    const char* value = std::getenv(name);
    if (!value || !*value) return fallback;

    char* end = nullptr;
    long parsed = std::strtol(value, &end, 10);
    if (*end != '\0' || parsed < min || parsed > max)
        throw std::runtime_error(std::string(name) + " must be an integer in [" + std::to_string(min) + ", " + std::to_string(max) + "].");
    return parsed;
}

double ConfigurationManager::readDouble(char const* name, double fallback)
{
    const char* value = std::getenv(name);
    if (!value || !*value) return fallback;

    char* end = nullptr;
    double parsed = std::strtod(value, &end);
    if (*end != '\0')
        throw std::runtime_error(std::string(name) + " must be a number.");
    return parsed;
}

std::string const& ConfigurationManager::getDatabasePath() const noexcept { return databasePath; }
std::string const& ConfigurationManager::getApiHost() const noexcept { return apiHost; }
std::string const& ConfigurationManager::getApiPort() const noexcept { return apiPort; }
std::uint16_t ConfigurationManager::getListenPort() const noexcept { return listenPort; }
double ConfigurationManager::getMaxDistanceKm() const noexcept { return maxDistanceKm; }
std::chrono::seconds ConfigurationManager::getUpstreamTimeout() const noexcept { return upstreamTimeout; }
int ConfigurationManager::getArrivalsDurationMin() const noexcept { return arrivalsDurationMin; }
std::string const& ConfigurationManager::getTimeZone() const noexcept { return timeZone; }

void ConfigurationManager::setDatabasePath(std::string path) { databasePath = std::move(path); }
void ConfigurationManager::setListenPort(std::uint16_t port) { listenPort = port; }
