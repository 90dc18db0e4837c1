#pragma once
#include <string>
#include <vector>
#include <boost/json.hpp>
#include "Types.hpp"

// File of live-observed trip polylines: a JSON array of GeoJSON FeatureCollections
// whose stop features carry the station id in properties.id.
class PolylineDump
{
public:
    static std::vector<std::vector<PolylineVertex>> read(std::string const& path);
    static void write(std::string const& path, boost::json::array const& polylines);

    // Cuts a polyline wherever the annotated station changes. Vertices before the
    // first and after the last annotated station belong to no leg.
    static std::vector<PolylineLeg> splitLegs(std::vector<PolylineVertex> const& vertices);
};
