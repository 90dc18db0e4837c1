#include <string>
#include <iostream>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <csignal>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/beast.hpp>
#include "ConfigurationManager.hpp"
#include "ServiceState.hpp"
#include "PositionEstimator.hpp"
#include "VirtualClock.hpp"
#include "Errors.hpp"

namespace http = boost::beast::http;

using HttpResponse = http::response<http::string_body>;

HttpResponse makeResponse(http::status status, unsigned version, std::string contentType, std::string body)
{
    HttpResponse response(status, version);
    response.set(http::field::server, "train-locator");
    response.set(http::field::content_type, contentType);
    response.set(http::field::access_control_allow_origin, "*");
    response.keep_alive(false);
    response.body() = std::move(body);
    response.prepare_payload();
    return response;
}

boost::asio::awaitable<HttpResponse> route(http::request<http::string_body> const& request, ServiceState& state)
{
    std::string target(request.target());
    std::size_t q = target.find('?');
    std::string path = target.substr(0, q);
    std::string query = q == std::string::npos ? "" : target.substr(q + 1);

    if (request.method() != http::verb::get)
        co_return makeResponse(http::status::method_not_allowed, request.version(), "text/plain", "Only GET is supported\n");

    if (path == "/search")
    {
        std::string error;
        auto coordinate = ServiceState::parseSearchQuery(query, error);
        if (!coordinate)
            co_return makeResponse(http::status::bad_request, request.version(), "text/plain", error + "\n");

        std::string body = co_await state.search(*coordinate);
        co_return makeResponse(http::status::ok, request.version(), "application/json", std::move(body));
    }

    if (path == "/stats")
        co_return makeResponse(http::status::ok, request.version(), "application/json", state.stats());

    co_return makeResponse(http::status::not_found, request.version(), "text/plain", "Not found\n");
}

boost::asio::awaitable<void> handleHttpClient(boost::asio::ip::tcp::socket socket, ServiceState& state)
{
    boost::beast::tcp_stream stream(std::move(socket));
    try
    {
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> request;

        stream.expires_after(std::chrono::seconds(30));
        co_await http::async_read(stream, buffer, request, boost::asio::use_awaitable);

        HttpResponse response = co_await route(request, state);

        stream.expires_after(std::chrono::seconds(30));
        co_await http::async_write(stream, response, boost::asio::use_awaitable);

        boost::system::error_code ignore;
        stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignore);
    }
    catch (IndexStoreFatalError const&)
    {
        throw;
    }
    catch (boost::system::system_error const& e)
    {
        auto code = e.code();
        if (code == boost::asio::error::operation_aborted ||
            code == boost::asio::error::connection_reset ||
            code == boost::asio::error::connection_aborted ||
            code == boost::asio::error::eof ||
            code == http::error::end_of_stream ||
            code == boost::beast::error::timeout)
        {
            co_return;
        }

        std::cerr << "HTTP handler error: " << e.what() << "\n";
    }
    catch (std::exception const& e)
    {
        std::cerr << "HTTP handler error: " << e.what() << "\n";
    }
}

// Anything escaping a coroutine (only IndexStoreFatalError by construction) ends io_context::run.
void rethrowFailure(std::exception_ptr e)
{
    if (e) std::rethrow_exception(e);
}

boost::asio::awaitable<void> httpAcceptLoop(boost::asio::ip::tcp::acceptor& acceptor, ServiceState& state)
{
    for (;;)
    {
        boost::asio::ip::tcp::socket socket = co_await acceptor.async_accept(boost::asio::use_awaitable);
        boost::asio::co_spawn(acceptor.get_executor(), handleHttpClient(std::move(socket), state), rethrowFailure);
    }
}

struct CommandLine
{
    std::string databasePath;
    std::uint16_t port = 0;
    std::time_t fixedTime = 0;
    bool perpendicularMetric = false;
};

CommandLine parseCommandLineArgs(int argc, char* argv[])
{
    CommandLine args;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--db" && i + 1 < argc)
        {
            args.databasePath = argv[++i];
        }
        else if (arg == "--port" && i + 1 < argc)
        {
            long port = std::strtol(argv[++i], nullptr, 10);
            if (port <= 0 || port > 65535)
                throw std::runtime_error("--port must be in [1, 65535]");
            args.port = static_cast<std::uint16_t>(port);
        }
        else if (arg == "--fixed-time" && i + 1 < argc)
        {
            args.fixedTime = static_cast<std::time_t>(std::strtoll(argv[++i], nullptr, 10));
            if (args.fixedTime <= 0)
                throw std::runtime_error("--fixed-time expects a positive unix timestamp");
        }
        else if (arg == "--perpendicular-metric")
        {
            args.perpendicularMetric = true;
        }
        else
        {
            std::cerr << "Warning: ignoring unknown or malformed argument: " << arg << "\n";
        }
    }

    return args;
}

int main(int argc, char* argv[])
{
    try
    {
        CommandLine args = parseCommandLineArgs(argc, argv);

        ConfigurationManager config;
        if (!args.databasePath.empty()) config.setDatabasePath(args.databasePath);
        if (args.port != 0) config.setListenPort(args.port);

        if (args.fixedTime != 0)
        {
            VirtualClock::freeze(args.fixedTime);
            std::cout << "[System] Clock frozen at " << args.fixedTime << "\n";
        }

        EstimatorOptions options;
        options.maxDistanceKm = config.getMaxDistanceKm();
        if (args.perpendicularMetric)
            options.metric = LegMetric::Perpendicular;

        boost::asio::io_context io;
        ServiceState state(io, config, options);

        boost::asio::ip::tcp::acceptor acceptor(io, {boost::asio::ip::tcp::v4(), config.getListenPort()});
        std::cout << "[System] Train locator listening on http://localhost:" << config.getListenPort() << "\n";

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&io](boost::system::error_code const&, int)
        {
            std::cout << "[System] Shutting down." << std::endl;
            io.stop();
        });

        boost::asio::co_spawn(io, httpAcceptLoop(acceptor, state), rethrowFailure);

        io.run();
    }
    catch (IndexStoreFatalError const& e)
    {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
    catch (std::exception const& e)
    {
        std::cerr << "Main Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
