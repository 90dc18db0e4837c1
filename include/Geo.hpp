#pragma once
#include <vector>
#include "Types.hpp"

class Geo
{
public:
    static double distanceMeters(Coordinate const& a, Coordinate const& b);
    static double distanceKm(Coordinate const& a, Coordinate const& b);

    // Linear blend of coordinates, exact at ratio 0 and 1.
    static Coordinate interpolate(Coordinate const& a, Coordinate const& b, double ratio);

    // Distance from p to the infinite line through a and b, in degrees.
    static double perpendicularDistance(Coordinate const& p, Coordinate const& a, Coordinate const& b);

    // Distance from p to the closed segment a-b, in degrees.
    static double segmentDistance(Coordinate const& p, Coordinate const& a, Coordinate const& b);

    // Inserts samples so no two neighbours are more than spacingMeters apart by cumulative distance.
    static Shape densify(Shape const& shape, double spacingMeters);

    // Same as densify, measured by great-circle length along the polyline.
    static std::vector<Coordinate> resample(std::vector<Coordinate> const& points, double spacingMeters);

private:
    static constexpr double EARTH_RADIUS_METERS = 6371000.0;
    static double toRadians(double degrees);
};
