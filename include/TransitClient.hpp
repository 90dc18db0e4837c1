#pragma once
#include <string>
#include <vector>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/json.hpp>
#include "Types.hpp"

class ConfigurationManager;

struct RequestCounters
{
    std::atomic<std::uint64_t> arrivals{0};
    std::atomic<std::uint64_t> polylines{0};
};

// HTTPS client for the transit-realtime REST source. One connection per request.
class TransitClient
{
private:
    using Stream = boost::beast::ssl_stream<boost::beast::tcp_stream>;
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    boost::asio::io_context& ioContext;
    boost::asio::ssl::context sslContext;
    std::string host;
    std::string port;
    std::chrono::seconds timeout;
    int arrivalsDurationMin;
    RequestCounters& counters;

    void configureTlsStream(Stream& stream);
    boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> resolve(boost::asio::ip::tcp::resolver& resolver);
    boost::asio::awaitable<void> connect(boost::asio::ip::tcp::resolver::results_type results, Stream& stream);
    Request buildGetRequest(std::string const& target) const;
    boost::asio::awaitable<void> sendRequest(Stream& stream, Request const& request);
    boost::asio::awaitable<Response> readResponse(Stream& stream);
    boost::asio::awaitable<void> shutdownStream(Stream& stream);
    boost::asio::awaitable<std::string> fetch(std::string const& target);

public:
    TransitClient(boost::asio::io_context& ioc, ConfigurationManager const& config, RequestCounters& counters);

    boost::asio::awaitable<std::vector<ArrivalRecord>> fetchArrivals(StationId station);

    // The trip's GeoJSON polyline, stops annotated with their station id.
    boost::asio::awaitable<boost::json::value> fetchTripPolyline(std::string const& tripId);

    static std::string urlEncode(std::string const& value);
};
