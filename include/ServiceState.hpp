#pragma once
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <functional>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include "Types.hpp"
#include "ConfigurationManager.hpp"
#include "IndexStore.hpp"
#include "TransitClient.hpp"
#include "PositionEstimator.hpp"

struct StationFetchOutcome
{
    StationId station = 0;
    bool ok = false;
    std::string error;
    std::vector<ArrivalRecord> arrivals;
};

// One station's arrival board.
using ArrivalsSource = std::function<boost::asio::awaitable<std::vector<ArrivalRecord>>(StationId)>;

// Everything a query needs, created once at startup and torn down at shutdown.
class ServiceState
{
private:
    ConfigurationManager const& config;
    RequestCounters counters;
    IndexStore store;
    std::unique_ptr<TransitClient> client;
    ArrivalsSource arrivals;
    PositionEstimator estimator;

    // Candidate lookup with one reconnect attempt when the previous query lost the store.
    std::optional<StationIdSet> lookupCandidates(Coordinate const& query);

public:
    // Boards come from the live upstream through TransitClient.
    ServiceState(boost::asio::io_context& ioc, ConfigurationManager const& config, EstimatorOptions options);

    ServiceState(ConfigurationManager const& config, EstimatorOptions options, ArrivalsSource arrivals);

    // JSON body for GET /search. Throws IndexStoreFatalError when the store is gone for good.
    boost::asio::awaitable<std::string> search(Coordinate query);

    // One arrival board request at a time; a failing station never aborts the others.
    boost::asio::awaitable<std::vector<StationFetchOutcome>> fetchBoards(StationIdSet const& stations);

    std::string stats() const;

    static ArrivalBoards collectBoards(std::vector<StationFetchOutcome>& outcomes);

    // Reads lat/lon from a URL query string. On failure returns nullopt and sets error.
    static std::optional<Coordinate> parseSearchQuery(std::string const& query, std::string& error);
};
