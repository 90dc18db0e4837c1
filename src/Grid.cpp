#include <cmath>
#include "Grid.hpp"

GridCell Grid::quantize(double lat, double lon) noexcept
{
    return GridCell{
        static_cast<int>(std::lround(lat * CELLS_PER_DEGREE)),
        static_cast<int>(std::lround(lon * CELLS_PER_DEGREE))
    };
}

CellWindow Grid::window(GridCell center, int radius) noexcept
{
    return CellWindow{
        center.latIdx - radius, center.latIdx + radius,
        center.lonIdx - radius, center.lonIdx + radius
    };
}

CellWindow Grid::window(double lat, double lon, int radius) noexcept
{
    return window(quantize(lat, lon), radius);
}

bool Grid::contains(CellWindow const& w, GridCell cell) noexcept
{
    return cell.latIdx >= w.minLat && cell.latIdx <= w.maxLat
        && cell.lonIdx >= w.minLon && cell.lonIdx <= w.maxLon;
}
