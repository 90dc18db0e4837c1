#include "IndexBuilder.hpp"

#include <iostream>
#include <sstream>
#include <unordered_map>
#include "Errors.hpp"
#include "Geo.hpp"
#include "Grid.hpp"
#include "PolylineDump.hpp"

IndexBuilder::IndexBuilder(StationTable const& stations, double spacingMeters)
    : stations(stations), spacingMeters(spacingMeters)
{
}

void IndexBuilder::registerPair(GridCell cell, std::optional<StationId> a, std::optional<StationId> b)
{
    if (!a && !b)
        return;

    StationIdSet& set = index[cell];
    if (a) set.insert(*a);
    if (b) set.insert(*b);
}

void IndexBuilder::addRoutes(StaticRoutes const& routes)
{
    std::unordered_map<std::string, Shape> densified;
    densified.reserve(routes.shapes.size());
    for (auto const& kv : routes.shapes)
        densified.emplace(kv.first, Geo::densify(kv.second, spacingMeters));

    for (TripOnShape const& trip : routes.trips)
    {
        auto shape = densified.find(trip.shapeId);
        if (shape == densified.end())
            continue;
        addTrip(shape->second, trip.stops, trip.tripId);
    }

    std::cout << "[Builder] Registered " << tripsRegistered << " trips into "
              << index.size() << " cells (" << unresolvedNames << " unresolved stop names)\n";
}

void IndexBuilder::addTrip(Shape const& shape, TripStopSequence const& stops, std::string const& tripId)
{
    if (stops.size() < 2 || shape.empty())
        return;

    for (std::size_t i = 1; i < stops.size(); ++i)
    {
        if (stops[i].distance < stops[i - 1].distance)
        {
            std::ostringstream msg;
            msg << "trip " << tripId << ": stop distance decreases at '" << stops[i].stationName
                << "' (" << stops[i - 1].distance << " -> " << stops[i].distance << ")";
            throw DataIntegrityError(msg.str());
        }
    }

    double first = stops.front().distance;
    double last  = stops.back().distance;
    if (shape.front().distance > first || shape.back().distance < last)
    {
        std::ostringstream msg;
        msg << "trip " << tripId << ": stops span [" << first << ", " << last
            << "] but shape covers [" << shape.front().distance << ", " << shape.back().distance << "]";
        throw DataIntegrityError(msg.str());
    }

    std::vector<std::optional<StationId>> resolved;
    resolved.reserve(stops.size());
    for (TripStop const& stop : stops)
    {
        auto id = stations.resolve(stop.stationName);
        if (!id) ++unresolvedNames;
        resolved.push_back(id);
    }

    std::size_t k = 0;
    for (ShapePoint const& sample : shape)
    {
        while (k + 2 < stops.size() && stops[k + 1].distance < sample.distance)
            ++k;

        if (sample.distance < stops[k].distance || sample.distance > stops[k + 1].distance)
        {
            std::ostringstream msg;
            msg << "trip " << tripId << ": shape sample at " << sample.distance
                << " m lies outside bracket [" << stops[k].distance << ", " << stops[k + 1].distance << "]";
            throw DataIntegrityError(msg.str());
        }

        registerPair(Grid::quantize(sample.lat, sample.lon), resolved[k], resolved[k + 1]);
    }

    ++tripsRegistered;
}

void IndexBuilder::addPolyline(std::vector<PolylineVertex> const& vertices)
{
    for (PolylineLeg const& leg : PolylineDump::splitLegs(vertices))
    {
        for (Coordinate const& c : Geo::resample(leg.points, spacingMeters))
            registerPair(Grid::quantize(c.lat, c.lon), leg.from, leg.to);
        ++legsRegistered;
    }
}

CandidateStationSet const& IndexBuilder::cells() const noexcept
{
    return index;
}

std::size_t IndexBuilder::unresolvedNameCount() const noexcept
{
    return unresolvedNames;
}

std::size_t IndexBuilder::tripCount() const noexcept
{
    return tripsRegistered;
}

std::size_t IndexBuilder::legCount() const noexcept
{
    return legsRegistered;
}
