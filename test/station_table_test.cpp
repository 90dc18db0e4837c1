#include "gtest/gtest.h"

#include <cstdio>
#include <filesystem>
#include <fstream>

#include "StationTable.hpp"

TEST(station_table, normalize_removes_space_before_parenthesis)
{
    EXPECT_EQ("Frankfurt(Main) Hbf", StationTable::normalizeName("Frankfurt (Main) Hbf"));
    EXPECT_EQ("Berlin Hbf", StationTable::normalizeName("Berlin Hbf"));
    EXPECT_EQ("Halle(Saale)Hbf", StationTable::normalizeName("Halle (Saale)Hbf"));
}

TEST(station_table, resolve_tries_exact_name_first)
{
    StationTable stations;
    stations.add("Frankfurt (Main) Hbf", 1);
    stations.add("Frankfurt(Main) Hbf", 2);

    EXPECT_EQ(1, stations.resolve("Frankfurt (Main) Hbf"));
    EXPECT_EQ(2, stations.resolve("Frankfurt(Main) Hbf"));
}

TEST(station_table, resolve_falls_back_to_normalized_name)
{
    StationTable stations;
    stations.add("Frankfurt(Main) Hbf", 8000105);

    EXPECT_EQ(8000105, stations.resolve("Frankfurt (Main) Hbf"));
    EXPECT_FALSE(stations.resolve("Offenbach (Main) Hbf").has_value());
}

TEST(station_table, loads_semicolon_separated_file)
{
    auto path = std::filesystem::temp_directory_path() / "train_locator_stations_test.csv";
    {
        std::ofstream out(path);
        out << "EVA_NR;DS100;NAME;Verkehr\n"
            << "8011160;BL;Berlin Hbf;FV\n"
            << "8000105;FF;\"Frankfurt(Main) Hbf\";FV\n"
            << "not-a-number;XX;Broken;RV\n";
    }

    StationTable stations(path.string());
    EXPECT_EQ(2u, stations.size());
    EXPECT_EQ(8011160, stations.resolve("Berlin Hbf"));
    EXPECT_EQ(8000105, stations.resolve("Frankfurt (Main) Hbf"));

    std::filesystem::remove(path);
}

TEST(station_table, missing_file_throws)
{
    EXPECT_THROW(StationTable("/nonexistent/stations.csv"), std::runtime_error);
}
