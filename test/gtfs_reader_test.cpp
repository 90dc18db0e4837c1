#include "gtest/gtest.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "GtfsReader.hpp"

namespace {

namespace fs = std::filesystem;

void writeFile(fs::path const& path, std::string const& content)
{
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

struct GtfsDir
{
    fs::path dir = fs::temp_directory_path() / "train_locator_gtfs_test";

    GtfsDir()
    {
        fs::remove_all(dir);
        fs::create_directories(dir);

        writeFile(dir / "shapes.txt",
                  "shape_id,shape_pt_lat,shape_pt_lon,shape_pt_sequence,shape_dist_traveled\r\n"
                  "s1,50.0020,8.0000,3,400\r\n"
                  "s1,50.0000,8.0000,1,100\r\n"
                  "s1,50.0010,8.0000,2,250\r\n");
        writeFile(dir / "stops.txt",
                  "stop_id,stop_name,stop_lat,stop_lon\n"
                  "a,\"Frankfurt (Main) Hbf\",50.10,8.66\n"
                  "b,Offenbach Hbf,50.10,8.76\n");
        writeFile(dir / "trips.txt",
                  "route_id,service_id,trip_id,shape_id\n"
                  "r1,daily,t1,s1\n"
                  "r1,daily,t2,\n");
        writeFile(dir / "stop_times.txt",
                  "trip_id,arrival_time,departure_time,stop_id,stop_sequence,shape_dist_traveled\n"
                  "t1,10:05:00,10:05:00,b,2,400\n"
                  "t1,10:00:00,10:00:00,a,1,100\n"
                  "t2,11:00:00,11:00:00,a,1,100\n"
                  "t1,10:07:00,10:07:00,zz,3,500\n");
    }

    ~GtfsDir() { fs::remove_all(dir); }
};

}  // namespace

TEST(gtfs_reader, loads_shapes_and_trips_in_sequence_order)
{
    GtfsDir gtfs;
    StaticRoutes routes = GtfsReader::load(gtfs.dir.string());

    ASSERT_EQ(1u, routes.shapes.size());
    Shape const& shape = routes.shapes.at("s1");
    ASSERT_EQ(3u, shape.size());
    EXPECT_DOUBLE_EQ(100.0, shape[0].distance);
    EXPECT_DOUBLE_EQ(250.0, shape[1].distance);
    EXPECT_DOUBLE_EQ(400.0, shape[2].distance);
    EXPECT_DOUBLE_EQ(50.0020, shape[2].lat);

    // t2 has no shape; the stop_times row for the unknown stop is skipped.
    ASSERT_EQ(1u, routes.trips.size());
    TripOnShape const& trip = routes.trips[0];
    EXPECT_EQ("t1", trip.tripId);
    EXPECT_EQ("s1", trip.shapeId);
    ASSERT_EQ(2u, trip.stops.size());
    EXPECT_EQ("Frankfurt (Main) Hbf", trip.stops[0].stationName);
    EXPECT_DOUBLE_EQ(100.0, trip.stops[0].distance);
    EXPECT_EQ("Offenbach Hbf", trip.stops[1].stationName);
}

TEST(gtfs_reader, missing_file_throws)
{
    GtfsDir gtfs;
    fs::remove(gtfs.dir / "stop_times.txt");
    EXPECT_THROW(GtfsReader::load(gtfs.dir.string()), std::runtime_error);
}
