#include <cmath>
#include <algorithm>
#include "Geo.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

double Geo::toRadians(double degrees)
{
    return degrees * M_PI / 180.0;
}

double Geo::distanceMeters(Coordinate const& a, Coordinate const& b)
{
    double phi1 = toRadians(a.lat);
    double phi2 = toRadians(b.lat);
    double deltaPhi = toRadians(b.lat - a.lat);
    double deltaLambda = toRadians(b.lon - a.lon);

    double h = std::sin(deltaPhi / 2.0) * std::sin(deltaPhi / 2.0) +
               std::cos(phi1) * std::cos(phi2) * std::sin(deltaLambda / 2.0) * std::sin(deltaLambda / 2.0);
    double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));

    return EARTH_RADIUS_METERS * c;
}

double Geo::distanceKm(Coordinate const& a, Coordinate const& b)
{
    return distanceMeters(a, b) / 1000.0;
}

Coordinate Geo::interpolate(Coordinate const& a, Coordinate const& b, double ratio)
{
    if (ratio <= 0.0) return a;
    if (ratio >= 1.0) return b;
    return Coordinate{
        a.lat + (b.lat - a.lat) * ratio,
        a.lon + (b.lon - a.lon) * ratio
    };
}

double Geo::perpendicularDistance(Coordinate const& p, Coordinate const& a, Coordinate const& b)
{
    double dx = b.lon - a.lon;
    double dy = b.lat - a.lat;
    double length = std::hypot(dx, dy);
    if (length == 0.0)
        return std::hypot(p.lon - a.lon, p.lat - a.lat);

    double cross = dx * (p.lat - a.lat) - dy * (p.lon - a.lon);
    return std::fabs(cross) / length;
}

double Geo::segmentDistance(Coordinate const& p, Coordinate const& a, Coordinate const& b)
{
    double dx = b.lon - a.lon;
    double dy = b.lat - a.lat;
    double lengthSq = dx * dx + dy * dy;
    if (lengthSq == 0.0)
        return std::hypot(p.lon - a.lon, p.lat - a.lat);

    double t = ((p.lon - a.lon) * dx + (p.lat - a.lat) * dy) / lengthSq;
    t = std::clamp(t, 0.0, 1.0);

    double px = a.lon + t * dx;
    double py = a.lat + t * dy;
    return std::hypot(p.lon - px, p.lat - py);
}

Shape Geo::densify(Shape const& shape, double spacingMeters)
{
    Shape out;
    if (shape.empty())
        return out;

    out.reserve(shape.size());
    out.push_back(shape.front());

    for (std::size_t i = 1; i < shape.size(); ++i)
    {
        ShapePoint const& from = shape[i - 1];
        ShapePoint const& to   = shape[i];
        double gap = to.distance - from.distance;

        if (gap > spacingMeters)
        {
            int pieces = static_cast<int>(std::ceil(gap / spacingMeters));
            for (int k = 1; k < pieces; ++k)
            {
                double ratio = static_cast<double>(k) / pieces;
                out.push_back(ShapePoint{
                    from.lat + (to.lat - from.lat) * ratio,
                    from.lon + (to.lon - from.lon) * ratio,
                    from.distance + gap * ratio
                });
            }
        }
        out.push_back(to);
    }

    return out;
}

std::vector<Coordinate> Geo::resample(std::vector<Coordinate> const& points, double spacingMeters)
{
    std::vector<Coordinate> out;
    if (points.empty())
        return out;

    out.push_back(points.front());

    for (std::size_t i = 1; i < points.size(); ++i)
    {
        Coordinate const& from = points[i - 1];
        Coordinate const& to   = points[i];
        double gap = distanceMeters(from, to);

        if (gap > spacingMeters)
        {
            int pieces = static_cast<int>(std::ceil(gap / spacingMeters));
            for (int k = 1; k < pieces; ++k)
                out.push_back(interpolate(from, to, static_cast<double>(k) / pieces));
        }
        out.push_back(to);
    }

    return out;
}
