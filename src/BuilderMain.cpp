#include <string>
#include <vector>
#include <iostream>
#include <fstream>
#include <cstdlib>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/json.hpp>
#include "ConfigurationManager.hpp"
#include "Errors.hpp"
#include "GtfsReader.hpp"
#include "IndexBuilder.hpp"
#include "IndexStore.hpp"
#include "PolylineDump.hpp"
#include "StationTable.hpp"
#include "TransitClient.hpp"

struct BuilderArgs
{
    std::string gtfsDir;
    std::string stationsPath;
    std::string polylinesPath;
    std::string databasePath;
    double spacing = IndexBuilder::DEFAULT_SPACING_METERS;
    std::size_t batchSize = IndexStore::DEFAULT_BATCH_SIZE;
    bool force = false;

    std::string collectFrom;
    std::string collectOut;
};

// Releases the store's build lock however the build ends.
class BuildLock
{
private:
    IndexStore& store;

public:
    BuildLock(IndexStore& store, bool force) : store(store)
    {
        store.acquireBuildLock(force);
    }

    ~BuildLock()
    {
        try
        {
            store.releaseBuildLock();
        }
        catch (std::exception const& e)
        {
            std::cerr << "[Builder] Could not release build lock: " << e.what() << "\n";
        }
    }

    BuildLock(BuildLock const&) = delete;
    BuildLock& operator=(BuildLock const&) = delete;
};

void printUsage()
{
    std::cerr << "Usage:\n"
              << "  train_locator_build --gtfs <dir> --stations <csv> [--polylines <json>]\n"
              << "                      [--db <path>] [--spacing <meters>] [--batch <rows>] [--force]\n"
              << "  train_locator_build --collect-polylines <tripIds.txt> --out <json>\n";
}

BuilderArgs parseCommandLineArgs(int argc, char* argv[])
{
    BuilderArgs args;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (arg == "--gtfs" && hasValue)                   args.gtfsDir = argv[++i];
        else if (arg == "--stations" && hasValue)          args.stationsPath = argv[++i];
        else if (arg == "--polylines" && hasValue)         args.polylinesPath = argv[++i];
        else if (arg == "--db" && hasValue)                args.databasePath = argv[++i];
        else if (arg == "--collect-polylines" && hasValue) args.collectFrom = argv[++i];
        else if (arg == "--out" && hasValue)               args.collectOut = argv[++i];
        else if (arg == "--spacing" && hasValue)
        {
            args.spacing = std::strtod(argv[++i], nullptr);
            if (args.spacing <= 0.0)
                throw std::runtime_error("--spacing must be positive");
        }
        else if (arg == "--batch" && hasValue)
        {
            long batch = std::strtol(argv[++i], nullptr, 10);
            if (batch <= 0)
                throw std::runtime_error("--batch must be positive");
            args.batchSize = static_cast<std::size_t>(batch);
        }
        else if (arg == "--force")
        {
            args.force = true;
        }
        else
        {
            std::cerr << "Warning: ignoring unknown or malformed argument: " << arg << "\n";
        }
    }

    return args;
}

std::vector<std::string> readTripIds(std::string const& path)
{
    std::ifstream file(path);
    if (!file.is_open())
        throw std::runtime_error("Could not open trip id list " + path);

    std::vector<std::string> ids;
    std::string line;
    while (std::getline(file, line))
    {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) ids.push_back(line);
    }
    return ids;
}

boost::asio::awaitable<void> collectPolylines(TransitClient& client, std::vector<std::string> const& tripIds, boost::json::array& out)
{
    std::size_t failed = 0;
    for (std::string const& tripId : tripIds)
    {
        try
        {
            out.push_back(co_await client.fetchTripPolyline(tripId));
        }
        catch (std::exception const& e)
        {
            ++failed;
            std::cerr << "[Upstream] Polyline for " << tripId << " failed: " << e.what() << "\n";
        }
    }

    std::cout << "[Builder] Collected " << out.size() << " polylines (" << failed << " failed)\n";
}

int runCollection(BuilderArgs const& args)
{
    ConfigurationManager config;
    RequestCounters counters;
    boost::asio::io_context io;
    TransitClient client(io, config, counters);

    std::vector<std::string> tripIds = readTripIds(args.collectFrom);
    boost::json::array polylines;

    boost::asio::co_spawn(io, collectPolylines(client, tripIds, polylines),
                          [](std::exception_ptr e) { if (e) std::rethrow_exception(e); });
    io.run();

    PolylineDump::write(args.collectOut, polylines);
    std::cout << "[Builder] Wrote " << args.collectOut << " after "
              << counters.polylines.load() << " polyline requests\n";
    return 0;
}

int runBuild(BuilderArgs const& args)
{
    ConfigurationManager config;
    if (!args.databasePath.empty()) config.setDatabasePath(args.databasePath);

    IndexStore store(config.getDatabasePath(), IndexStore::Mode::ReadWrite);
    BuildLock lock(store, args.force);

    StationTable stations(args.stationsPath);
    if (stations.size() == 0)
        throw std::runtime_error("Station table " + args.stationsPath + " has no usable rows");
    IndexBuilder builder(stations, args.spacing);

    StaticRoutes routes = GtfsReader::load(args.gtfsDir);
    builder.addRoutes(routes);

    if (!args.polylinesPath.empty())
    {
        for (auto const& polyline : PolylineDump::read(args.polylinesPath))
            builder.addPolyline(polyline);
        std::cout << "[Builder] Registered " << builder.legCount() << " polyline legs\n";
    }

    std::string table = store.writeIndex(builder.cells(), args.batchSize);
    if (store.activeTable() != table)
        throw IndexStoreError("Active table is " + store.activeTable() + " after writing " + table);
    return 0;
}

int main(int argc, char* argv[])
{
    try
    {
        BuilderArgs args = parseCommandLineArgs(argc, argv);

        if (!args.collectFrom.empty())
        {
            if (args.collectOut.empty())
            {
                printUsage();
                return 2;
            }
            return runCollection(args);
        }

        if (args.gtfsDir.empty() || args.stationsPath.empty())
        {
            printUsage();
            return 2;
        }
        return runBuild(args);
    }
    catch (DataIntegrityError const& e)
    {
        std::cerr << "[Builder] Data integrity violation, build aborted: " << e.what() << "\n";
        return 1;
    }
    catch (std::exception const& e)
    {
        std::cerr << "[Builder] Error: " << e.what() << "\n";
        return 1;
    }
}
