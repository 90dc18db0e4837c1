#pragma once
#include <string>
#include <vector>
#include <optional>
#include <ctime>
#include <boost/json.hpp>
#include "Types.hpp"

class ArrivalParser
{
public:
    // Arrival board body, either {"arrivals":[...]} or a bare array.
    static std::vector<ArrivalRecord> extractArrivals(std::string const& data);

    // The trip's polyline FeatureCollection from a /trips/<id> body.
    static boost::json::value extractTripPolyline(std::string const& data);

    static std::vector<PolylineVertex> extractVertices(boost::json::value const& featureCollection);

    // ISO 8601 with UTC offset ("2024-05-01T12:03:00+02:00"); null yields nullopt.
    static std::optional<std::time_t> parseTime(boost::json::value const* value);

private:
    static ArrivalRecord parseRecord(boost::json::object const& entry);
    static StopoverEvent parseStopover(boost::json::object const& entry);
    static Station parseStation(boost::json::value const& stop);
};
