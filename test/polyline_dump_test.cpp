#include "gtest/gtest.h"

#include <filesystem>

#include "PolylineDump.hpp"

TEST(polyline_dump, split_legs_at_station_changes)
{
    std::vector<PolylineVertex> vertices{
        {50.00, 8.00, std::nullopt},   // before the first stop, dropped
        {50.01, 8.01, 1},
        {50.02, 8.02, std::nullopt},
        {50.03, 8.03, 1},              // same station again, leg continues
        {50.04, 8.04, 2},
        {50.05, 8.05, std::nullopt},
        {50.06, 8.06, 3},
        {50.07, 8.07, std::nullopt}    // after the last stop, dropped
    };

    auto legs = PolylineDump::splitLegs(vertices);

    ASSERT_EQ(2u, legs.size());
    EXPECT_EQ(1, legs[0].from);
    EXPECT_EQ(2, legs[0].to);
    ASSERT_EQ(4u, legs[0].points.size());
    EXPECT_DOUBLE_EQ(50.01, legs[0].points.front().lat);
    EXPECT_DOUBLE_EQ(50.04, legs[0].points.back().lat);

    EXPECT_EQ(2, legs[1].from);
    EXPECT_EQ(3, legs[1].to);
    ASSERT_EQ(3u, legs[1].points.size());
}

TEST(polyline_dump, no_annotations_no_legs)
{
    std::vector<PolylineVertex> vertices{{50.0, 8.0, std::nullopt}, {50.1, 8.1, std::nullopt}};
    EXPECT_TRUE(PolylineDump::splitLegs(vertices).empty());
}

TEST(polyline_dump, reads_written_feature_collections)
{
    auto path = std::filesystem::temp_directory_path() / "train_locator_polylines_test.json";

    boost::json::array dump{boost::json::parse(R"({
        "type": "FeatureCollection",
        "features": [
          {"type": "Feature", "properties": {"type": "stop", "id": "8000105"},
           "geometry": {"type": "Point", "coordinates": [8.663, 50.107]}},
          {"type": "Feature", "properties": {},
           "geometry": {"type": "Point", "coordinates": [8.70, 50.10]}},
          {"type": "Feature", "properties": {"type": "stop", "id": "8000068"},
           "geometry": {"type": "Point", "coordinates": [8.629, 49.872]}}
        ]
    })")};
    PolylineDump::write(path.string(), dump);

    auto polylines = PolylineDump::read(path.string());
    ASSERT_EQ(1u, polylines.size());
    ASSERT_EQ(3u, polylines[0].size());
    EXPECT_DOUBLE_EQ(50.107, polylines[0][0].lat);
    EXPECT_DOUBLE_EQ(8.663, polylines[0][0].lon);
    EXPECT_EQ(8000105, polylines[0][0].station);
    EXPECT_FALSE(polylines[0][1].station.has_value());
    EXPECT_EQ(8000068, polylines[0][2].station);

    std::filesystem::remove(path);
}
