#include "gtest/gtest.h"

#include <cmath>

#include "Geo.hpp"

TEST(geo, great_circle_distance)
{
    Coordinate berlin{52.5251, 13.3694};
    Coordinate hamburg{53.5530, 10.0069};

    EXPECT_NEAR(255.0, Geo::distanceKm(berlin, hamburg), 3.0);
    EXPECT_DOUBLE_EQ(0.0, Geo::distanceMeters(berlin, berlin));
}

TEST(geo, interpolate_is_exact_at_endpoints)
{
    Coordinate a{52.0, 13.0};
    Coordinate b{52.2, 13.4};

    Coordinate start = Geo::interpolate(a, b, 0.0);
    Coordinate end = Geo::interpolate(a, b, 1.0);
    Coordinate mid = Geo::interpolate(a, b, 0.5);

    EXPECT_EQ(a.lat, start.lat);
    EXPECT_EQ(a.lon, start.lon);
    EXPECT_EQ(b.lat, end.lat);
    EXPECT_EQ(b.lon, end.lon);
    EXPECT_NEAR(52.1, mid.lat, 1e-12);
    EXPECT_NEAR(13.2, mid.lon, 1e-12);
}

TEST(geo, segment_distance_clamps_beyond_endpoint)
{
    Coordinate a{0.0, 0.0};
    Coordinate b{0.0, 1.0};
    Coordinate beyond{1.0, 2.0};
    Coordinate above{1.0, 0.5};

    EXPECT_NEAR(1.0, Geo::perpendicularDistance(beyond, a, b), 1e-12);
    EXPECT_NEAR(std::sqrt(2.0), Geo::segmentDistance(beyond, a, b), 1e-12);

    EXPECT_NEAR(1.0, Geo::perpendicularDistance(above, a, b), 1e-12);
    EXPECT_NEAR(1.0, Geo::segmentDistance(above, a, b), 1e-12);
}

TEST(geo, degenerate_leg_measures_to_the_point)
{
    Coordinate a{10.0, 10.0};
    Coordinate p{13.0, 14.0};

    EXPECT_NEAR(5.0, Geo::perpendicularDistance(p, a, a), 1e-12);
    EXPECT_NEAR(5.0, Geo::segmentDistance(p, a, a), 1e-12);
}

TEST(geo, densify_limits_gaps)
{
    Shape shape{
        {52.000, 13.000, 100.0},
        {52.000, 13.002, 250.0},
        {52.000, 13.004, 400.0},
        {52.000, 13.010, 1000.0}
    };

    Shape dense = Geo::densify(shape, 100.0);

    ASSERT_GE(dense.size(), shape.size());
    EXPECT_EQ(100.0, dense.front().distance);
    EXPECT_EQ(1000.0, dense.back().distance);
    for (std::size_t i = 1; i < dense.size(); ++i)
    {
        EXPECT_GE(dense[i].distance, dense[i - 1].distance);
        EXPECT_LE(dense[i].distance - dense[i - 1].distance, 100.0 + 1e-9);
    }
    // 100 -> 250 gets one midpoint, 400 -> 1000 gets five
    EXPECT_EQ(4u + 1u + 1u + 5u, dense.size());
}

TEST(geo, resample_limits_great_circle_gaps)
{
    std::vector<Coordinate> leg{{52.0, 13.0}, {52.0, 13.02}, {52.01, 13.02}};
    std::vector<Coordinate> dense = Geo::resample(leg, 100.0);

    ASSERT_GT(dense.size(), leg.size());
    for (std::size_t i = 1; i < dense.size(); ++i)
        EXPECT_LE(Geo::distanceMeters(dense[i - 1], dense[i]), 100.5);
}
