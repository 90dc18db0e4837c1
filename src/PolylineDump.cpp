#include "PolylineDump.hpp"

#include <iostream>
#include <fstream>
#include <sstream>
#include <optional>
#include <stdexcept>
#include "ArrivalParser.hpp"

std::vector<std::vector<PolylineVertex>> PolylineDump::read(std::string const& path)
{
    std::ifstream file(path);
    if (!file.is_open())
        throw std::runtime_error("Could not open polyline dump " + path);

    std::stringstream buffer;
    buffer << file.rdbuf();

    boost::system::error_code ec;
    boost::json::value root = boost::json::parse(buffer.str(), ec);
    if (ec)
        throw std::runtime_error("Malformed polyline dump " + path + ": " + ec.message());
    if (!root.is_array())
        throw std::runtime_error("Polyline dump " + path + " is not a JSON array");

    std::vector<std::vector<PolylineVertex>> polylines;
    for (auto const& collection : root.get_array())
    {
        if (!collection.is_object())
            continue;
        polylines.push_back(ArrivalParser::extractVertices(collection));
    }

    std::cout << "[Builder] Loaded " << polylines.size() << " polylines from " << path << "\n";
    return polylines;
}

void PolylineDump::write(std::string const& path, boost::json::array const& polylines)
{
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open())
        throw std::runtime_error("Could not write polyline dump " + path);

    file << boost::json::serialize(polylines);
    if (!file.good())
        throw std::runtime_error("Failed writing polyline dump " + path);
}

std::vector<PolylineLeg> PolylineDump::splitLegs(std::vector<PolylineVertex> const& vertices)
{
    std::vector<PolylineLeg> legs;
    std::optional<StationId> current;
    std::vector<Coordinate> points;

    for (PolylineVertex const& v : vertices)
    {
        Coordinate c{v.lat, v.lon};

        if (!current)
        {
            if (v.station)
            {
                current = v.station;
                points.assign(1, c);
            }
            continue;
        }

        points.push_back(c);

        if (v.station && *v.station != *current)
        {
            legs.push_back(PolylineLeg{*current, *v.station, points});
            current = v.station;
            points.assign(1, c);
        }
    }

    return legs;
}
