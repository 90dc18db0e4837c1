#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include "Types.hpp"

struct TripOnShape
{
    std::string tripId;
    std::string shapeId;
    TripStopSequence stops;
};

struct StaticRoutes
{
    std::unordered_map<std::string, Shape> shapes;
    std::vector<TripOnShape> trips;
};

class GtfsReader
{
public:
    // Reads shapes.txt, trips.txt, stop_times.txt and stops.txt from a GTFS directory.
    static StaticRoutes load(std::string const& directory);

private:
    static std::unordered_map<std::string, Shape> readShapes(std::string const& path);
    static std::unordered_map<std::string, std::string> readStopNames(std::string const& path);
    static std::unordered_map<std::string, std::string> readTripShapes(std::string const& path);
    static std::unordered_map<std::string, TripStopSequence> readStopTimes(std::string const& path,
                                                                           std::unordered_map<std::string, std::string> const& stopNames);
};
