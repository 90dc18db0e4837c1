#include <iostream>
#include <iomanip>
#include <sstream>
#include <cctype>
#include "ConfigurationManager.hpp"
#include "TransitClient.hpp"
#include "ArrivalParser.hpp"
#include "Errors.hpp"
#include "Deadline.hpp"

TransitClient::TransitClient(boost::asio::io_context& ioc, ConfigurationManager const& config, RequestCounters& counters)
        : ioContext(ioc)
        , sslContext(boost::asio::ssl::context::tlsv12_client)
        , host(config.getApiHost())
        , port(config.getApiPort())
        , timeout(config.getUpstreamTimeout())
        , arrivalsDurationMin(config.getArrivalsDurationMin())
        , counters(counters)
    {
        sslContext.set_options(
            boost::asio::ssl::context::default_workarounds
            | boost::asio::ssl::context::no_sslv2
            | boost::asio::ssl::context::single_dh_use
        );

        sslContext.set_default_verify_paths();
        sslContext.set_verify_mode(boost::asio::ssl::verify_peer);
    }


void TransitClient::configureTlsStream(Stream& stream)
{
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str()))
    {
        throw boost::beast::system_error(boost::system::error_code(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()), "Failed to set SNI");
    }
    stream.set_verify_callback(boost::asio::ssl::host_name_verification(host));
}

boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> TransitClient::resolve(boost::asio::ip::tcp::resolver& resolver)
{
    // tcp_stream deadlines start at connect; the lookup needs its own.
    Deadline deadline(resolver.get_executor(), timeout, [&resolver] { resolver.cancel(); });

    boost::system::error_code ec;
    boost::asio::ip::tcp::resolver::results_type results =
        co_await resolver.async_resolve(host, port, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    deadline.disarm();

    if (deadline.expired())
        throw UpstreamFetchError("DNS lookup for " + host + " timed out after " + std::to_string(timeout.count()) + "s");
    if (ec)
        throw boost::system::system_error(ec, "resolve " + host);
    co_return results;
}

boost::asio::awaitable<void> TransitClient::connect(boost::asio::ip::tcp::resolver::results_type results, Stream& stream)
{
    boost::beast::get_lowest_layer(stream).expires_after(timeout);
    co_await boost::beast::get_lowest_layer(stream).async_connect(results, boost::asio::use_awaitable);

    boost::beast::get_lowest_layer(stream).expires_after(timeout);
    co_await stream.async_handshake(boost::asio::ssl::stream_base::client, boost::asio::use_awaitable);
    co_return;
}

TransitClient::Request TransitClient::buildGetRequest(std::string const& target) const
{
    Request request(boost::beast::http::verb::get, target, 11);
    request.set(boost::beast::http::field::host, host);
    request.set(boost::beast::http::field::user_agent, "train-locator " BOOST_BEAST_VERSION_STRING);
    request.set(boost::beast::http::field::accept, "application/json");

    return request;
}

boost::asio::awaitable<void> TransitClient::sendRequest(Stream& stream, Request const& request)
{
    boost::beast::get_lowest_layer(stream).expires_after(timeout);
    co_await boost::beast::http::async_write(stream, request, boost::asio::use_awaitable);
}

boost::asio::awaitable<TransitClient::Response> TransitClient::readResponse(Stream& stream)
{
    Response response;
    boost::beast::flat_buffer buffer;
    boost::beast::get_lowest_layer(stream).expires_after(timeout);
    co_await boost::beast::http::async_read(stream, buffer, response, boost::asio::use_awaitable);
    co_return response;
}

boost::asio::awaitable<void> TransitClient::shutdownStream(Stream& stream)
{
    // Servers commonly drop the connection without close_notify; nothing to act on.
    boost::system::error_code ec;
    boost::beast::get_lowest_layer(stream).expires_after(timeout);
    co_await stream.async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    co_return;
}

boost::asio::awaitable<std::string> TransitClient::fetch(std::string const& target)
{
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::ip::tcp::resolver resolver(ioContext);
    Stream stream(executor, sslContext);

    configureTlsStream(stream);
    boost::asio::ip::tcp::resolver::results_type results = co_await resolve(resolver);
    co_await connect(results, stream);
    Request request = buildGetRequest(target);
    co_await sendRequest(stream, request);
    Response response = co_await readResponse(stream);
    co_await shutdownStream(stream);

    if (response.result() != boost::beast::http::status::ok)
    {
        std::ostringstream msg;
        msg << "HTTP " << response.result_int() << " for " << target;
        throw UpstreamFetchError(msg.str());
    }

    co_return response.body();
}

boost::asio::awaitable<std::vector<ArrivalRecord>> TransitClient::fetchArrivals(StationId station)
{
    counters.arrivals.fetch_add(1, std::memory_order_relaxed);

    std::string target = "/stops/" + std::to_string(station) +
                         "/arrivals?duration=" + std::to_string(arrivalsDurationMin) +
                         "&stopovers=true&linesOfStops=false&remarks=false";

    std::string body = co_await fetch(target);
    co_return ArrivalParser::extractArrivals(body);
}

boost::asio::awaitable<boost::json::value> TransitClient::fetchTripPolyline(std::string const& tripId)
{
    counters.polylines.fetch_add(1, std::memory_order_relaxed);

    std::string target = "/trips/" + urlEncode(tripId) + "?polyline=true&stopovers=false&remarks=false";

    std::string body = co_await fetch(target);
    co_return ArrivalParser::extractTripPolyline(body);
}

std::string TransitClient::urlEncode(std::string const& value)
{
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : value)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
            out << c;
        else
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    }
    return out.str();
}
