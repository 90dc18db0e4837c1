#include "GtfsReader.hpp"

#include <iostream>
#include <fstream>
#include <algorithm>
#include <stdexcept>
#include <utility>
#include <initializer_list>
#include "Csv.hpp"

namespace
{

struct CsvFile
{
    std::ifstream stream;
    std::vector<std::string> header;

    explicit CsvFile(std::string const& path)
        : stream(path)
    {
        if (!stream.is_open())
            throw std::runtime_error("Could not open " + path);

        std::string line;
        std::getline(stream, line);
        header = Csv::splitLine(line);
    }

    int require(std::string const& column, std::string const& path) const
    {
        int idx = Csv::columnIndex(header, column);
        if (idx < 0)
            throw std::runtime_error(path + " has no column " + column);
        return idx;
    }
};

bool hasColumns(std::vector<std::string> const& row, std::initializer_list<int> columns)
{
    for (int c : columns)
        if (static_cast<std::size_t>(c) >= row.size()) return false;
    return true;
}

}

std::unordered_map<std::string, Shape> GtfsReader::readShapes(std::string const& path)
{
    CsvFile file(path);
    int idCol   = file.require("shape_id", path);
    int latCol  = file.require("shape_pt_lat", path);
    int lonCol  = file.require("shape_pt_lon", path);
    int seqCol  = file.require("shape_pt_sequence", path);
    int distCol = file.require("shape_dist_traveled", path);

    std::unordered_map<std::string, std::vector<std::pair<int, ShapePoint>>> raw;
    std::string line;
    while (std::getline(file.stream, line))
    {
        if (line.empty()) continue;
        auto row = Csv::splitLine(line);
        if (!hasColumns(row, {idCol, latCol, lonCol, seqCol, distCol})) continue;

        ShapePoint p;
        p.lat = std::stod(row[latCol]);
        p.lon = std::stod(row[lonCol]);
        p.distance = row[distCol].empty() ? 0.0 : std::stod(row[distCol]);
        raw[row[idCol]].emplace_back(std::stoi(row[seqCol]), p);
    }

    std::unordered_map<std::string, Shape> shapes;
    for (auto& kv : raw)
    {
        auto& points = kv.second;
        std::sort(points.begin(), points.end(),
                  [](auto const& a, auto const& b) { return a.first < b.first; });

        Shape& shape = shapes[kv.first];
        shape.reserve(points.size());
        for (auto const& p : points)
            shape.push_back(p.second);
    }

    return shapes;
}

std::unordered_map<std::string, std::string> GtfsReader::readStopNames(std::string const& path)
{
    CsvFile file(path);
    int idCol   = file.require("stop_id", path);
    int nameCol = file.require("stop_name", path);

    std::unordered_map<std::string, std::string> names;
    std::string line;
    while (std::getline(file.stream, line))
    {
        if (line.empty()) continue;
        auto row = Csv::splitLine(line);
        if (!hasColumns(row, {idCol, nameCol})) continue;
        names[row[idCol]] = row[nameCol];
    }
    return names;
}

std::unordered_map<std::string, std::string> GtfsReader::readTripShapes(std::string const& path)
{
    CsvFile file(path);
    int tripCol  = file.require("trip_id", path);
    int shapeCol = file.require("shape_id", path);

    std::unordered_map<std::string, std::string> shapeOf;
    std::string line;
    while (std::getline(file.stream, line))
    {
        if (line.empty()) continue;
        auto row = Csv::splitLine(line);
        if (!hasColumns(row, {tripCol, shapeCol})) continue;
        if (row[shapeCol].empty()) continue;
        shapeOf[row[tripCol]] = row[shapeCol];
    }
    return shapeOf;
}

std::unordered_map<std::string, TripStopSequence> GtfsReader::readStopTimes(std::string const& path,
                                                                            std::unordered_map<std::string, std::string> const& stopNames)
{
    CsvFile file(path);
    int tripCol = file.require("trip_id", path);
    int stopCol = file.require("stop_id", path);
    int seqCol  = file.require("stop_sequence", path);
    int distCol = file.require("shape_dist_traveled", path);

    std::unordered_map<std::string, std::vector<std::pair<int, TripStop>>> raw;
    std::size_t unknownStops = 0;
    std::string line;
    while (std::getline(file.stream, line))
    {
        if (line.empty()) continue;
        auto row = Csv::splitLine(line);
        if (!hasColumns(row, {tripCol, stopCol, seqCol, distCol})) continue;

        auto name = stopNames.find(row[stopCol]);
        if (name == stopNames.end())
        {
            ++unknownStops;
            continue;
        }

        TripStop stop;
        stop.stationName = name->second;
        stop.distance = row[distCol].empty() ? 0.0 : std::stod(row[distCol]);
        raw[row[tripCol]].emplace_back(std::stoi(row[seqCol]), std::move(stop));
    }

    if (unknownStops > 0)
        std::cerr << "[Builder] " << unknownStops << " stop_times rows reference unknown stops\n";

    std::unordered_map<std::string, TripStopSequence> sequences;
    for (auto& kv : raw)
    {
        auto& stops = kv.second;
        std::sort(stops.begin(), stops.end(),
                  [](auto const& a, auto const& b) { return a.first < b.first; });

        TripStopSequence& seq = sequences[kv.first];
        seq.reserve(stops.size());
        for (auto& s : stops)
            seq.push_back(std::move(s.second));
    }
    return sequences;
}

StaticRoutes GtfsReader::load(std::string const& directory)
{
    std::string base = directory.empty() || directory.back() == '/' ? directory : directory + "/";

    StaticRoutes routes;
    routes.shapes = readShapes(base + "shapes.txt");
    auto stopNames = readStopNames(base + "stops.txt");
    auto shapeOf = readTripShapes(base + "trips.txt");
    auto stopTimes = readStopTimes(base + "stop_times.txt", stopNames);

    for (auto& kv : stopTimes)
    {
        auto shape = shapeOf.find(kv.first);
        if (shape == shapeOf.end() || !routes.shapes.count(shape->second))
            continue;

        routes.trips.push_back(TripOnShape{kv.first, shape->second, std::move(kv.second)});
    }

    std::cout << "[Builder] Loaded " << routes.shapes.size() << " shapes, "
              << routes.trips.size() << " trips with shapes\n";
    return routes;
}
