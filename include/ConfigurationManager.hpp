#pragma once
#include <string>
#include <chrono>
#include <cstdint>

class ConfigurationManager
{
private:
    std::string databasePath;
    std::string apiHost;
    std::string apiPort;
    std::uint16_t listenPort;
    double maxDistanceKm;
    std::chrono::seconds upstreamTimeout;
    int arrivalsDurationMin;
    std::string timeZone;

    static std::string readString(char const* name, std::string const& fallback);
    static long readInteger(char const* name, long fallback, long min, long max);
    static double readDouble(char const* name, double fallback);

public:
    ConfigurationManager();

    static inline const std::string DEFAULT_DB_PATH   = "trainLocator.db";
    static inline const std::string DEFAULT_API_HOST  = "v6.db.transport.rest";
    static inline const std::string DEFAULT_API_PORT  = "443";
    static inline const std::string DEFAULT_TIME_ZONE = "Europe/Berlin";
    static constexpr std::uint16_t DEFAULT_LISTEN_PORT = 8080;
    static constexpr double DEFAULT_MAX_DISTANCE_KM = 50.0;
    static constexpr long DEFAULT_UPSTREAM_TIMEOUT_SEC = 10;
    static constexpr long DEFAULT_ARRIVALS_DURATION_MIN = 60;

    [[nodiscard]] std::string const& getDatabasePath() const noexcept;
    [[nodiscard]] std::string const& getApiHost() const noexcept;
    [[nodiscard]] std::string const& getApiPort() const noexcept;
    [[nodiscard]] std::uint16_t getListenPort() const noexcept;
    [[nodiscard]] double getMaxDistanceKm() const noexcept;
    [[nodiscard]] std::chrono::seconds getUpstreamTimeout() const noexcept;
    [[nodiscard]] int getArrivalsDurationMin() const noexcept;
    [[nodiscard]] std::string const& getTimeZone() const noexcept;

    void setDatabasePath(std::string path);
    void setListenPort(std::uint16_t port);
};
