#include <iostream>
#include <cmath>
#include <cstdlib>
#include <cctype>
#include <utility>
#include <boost/asio/use_awaitable.hpp>
#include "ServiceState.hpp"
#include "ResponseWriter.hpp"
#include "VirtualClock.hpp"
#include "Errors.hpp"

namespace
{

std::string urlDecode(std::string const& in)
{
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i)
    {
        if (in[i] == '+')
            out += ' ';
        else if (in[i] == '%' && i + 2 < in.size()
                 && std::isxdigit(static_cast<unsigned char>(in[i + 1]))
                 && std::isxdigit(static_cast<unsigned char>(in[i + 2])))
        {
            out += static_cast<char>(std::stoi(in.substr(i + 1, 2), nullptr, 16));
            i += 2;
        }
        else
            out += in[i];
    }
    return out;
}

std::optional<double> parseNumber(std::string const& text)
{
    if (text.empty())
        return std::nullopt;

    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (*end != '\0' || !std::isfinite(value))
        return std::nullopt;
    return value;
}

}

ServiceState::ServiceState(boost::asio::io_context& ioc, ConfigurationManager const& config, EstimatorOptions options)
    : config(config)
    , store(config.getDatabasePath(), IndexStore::Mode::ReadOnly)
    , client(std::make_unique<TransitClient>(ioc, config, counters))
    , arrivals([this](StationId station) { return client->fetchArrivals(station); })
    , estimator(std::move(options))
{
}

ServiceState::ServiceState(ConfigurationManager const& config, EstimatorOptions options, ArrivalsSource arrivals)
    : config(config)
    , store(config.getDatabasePath(), IndexStore::Mode::ReadOnly)
    , arrivals(std::move(arrivals))
    , estimator(std::move(options))
{
}

std::optional<Coordinate> ServiceState::parseSearchQuery(std::string const& query, std::string& error)
{
    std::optional<std::string> lat;
    std::optional<std::string> lon;

    std::size_t start = 0;
    while (start <= query.size())
    {
        std::size_t end = query.find('&', start);
        if (end == std::string::npos) end = query.size();

        std::string pair = query.substr(start, end - start);
        std::size_t eq = pair.find('=');
        std::string key = urlDecode(pair.substr(0, eq));
        std::string value = eq == std::string::npos ? "" : urlDecode(pair.substr(eq + 1));

        if (key == "lat") lat = value;
        else if (key == "lon") lon = value;

        start = end + 1;
    }

    if (!lat || !lon)
    {
        error = "Missing query parameter: lat and lon are required";
        return std::nullopt;
    }

    auto latValue = parseNumber(*lat);
    auto lonValue = parseNumber(*lon);
    if (!latValue)
    {
        error = "Invalid lat: '" + *lat + "' is not a number";
        return std::nullopt;
    }
    if (!lonValue)
    {
        error = "Invalid lon: '" + *lon + "' is not a number";
        return std::nullopt;
    }
    if (std::fabs(*latValue) > 90.0 || std::fabs(*lonValue) > 180.0)
    {
        error = "Coordinate out of range";
        return std::nullopt;
    }

    return Coordinate{*latValue, *lonValue};
}

std::optional<StationIdSet> ServiceState::lookupCandidates(Coordinate const& query)
{
    if (!store.isConnected())
        store.reconnect();

    try
    {
        return store.getCandidates(query.lat, query.lon);
    }
    catch (IndexStoreError const& e)
    {
        std::cerr << "[Search] Index store lookup failed: " << e.what() << "\n";
        return std::nullopt;
    }
}

boost::asio::awaitable<std::vector<StationFetchOutcome>> ServiceState::fetchBoards(StationIdSet const& stations)
{
    std::vector<StationFetchOutcome> outcomes;
    outcomes.reserve(stations.size());

    for (StationId station : stations)
    {
        StationFetchOutcome outcome;
        outcome.station = station;
        try
        {
            outcome.arrivals = co_await arrivals(station);
            outcome.ok = true;
        }
        catch (std::exception const& e)
        {
            outcome.error = e.what();
            std::cerr << "[Upstream] Arrivals for " << station << " failed: " << e.what() << "\n";
        }
        outcomes.push_back(std::move(outcome));
    }

    co_return outcomes;
}

ArrivalBoards ServiceState::collectBoards(std::vector<StationFetchOutcome>& outcomes)
{
    ArrivalBoards boards;
    for (StationFetchOutcome& o : outcomes)
    {
        if (o.ok)
            boards[o.station] = std::move(o.arrivals);
    }
    return boards;
}

boost::asio::awaitable<std::string> ServiceState::search(Coordinate query)
{
    auto candidates = lookupCandidates(query);
    if (!candidates)
        co_return ResponseWriter::degradedBody("index store unavailable");

    std::vector<StationFetchOutcome> outcomes = co_await fetchBoards(*candidates);
    std::size_t failed = 0;
    for (auto const& o : outcomes)
        if (!o.ok) ++failed;

    ArrivalBoards boards = collectBoards(outcomes);
    EstimateResult result = estimator.estimate(query, *candidates, boards, VirtualClock::now());

    std::cout << "[Search] " << query.lat << "," << query.lon
              << ": " << candidates->size() << " stations (" << failed << " failed), "
              << result.considered << " arrivals considered, "
              << result.trains.size() << " trains emitted" << std::endl;

    co_return ResponseWriter::searchBody(*candidates, result.trains, config.getTimeZone());
}

std::string ServiceState::stats() const
{
    return ResponseWriter::statsBody(counters);
}
