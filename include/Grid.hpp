#pragma once
#include "Types.hpp"

struct CellWindow
{
    int minLat = 0;
    int maxLat = 0;
    int minLon = 0;
    int maxLon = 0;
};

class Grid
{
public:
    static constexpr double CELLS_PER_DEGREE = 1000.0;
    static constexpr int SEARCH_RADIUS = 3;

    static GridCell quantize(double lat, double lon) noexcept;
    static CellWindow window(GridCell center, int radius = SEARCH_RADIUS) noexcept;
    static CellWindow window(double lat, double lon, int radius = SEARCH_RADIUS) noexcept;
    static bool contains(CellWindow const& w, GridCell cell) noexcept;
};
