#include "grid.hpp"
#include "constants.hpp"

Point Grid::wrap(Point p) const
{
        if (p.x < 0) {
                p.x = width - 1;
        }
        if (p.x >= width) {
                p.x = 0;
        }
        if (p.y < 0) {
                p.y = height - 1;
        }
        if (p.y >= height) {
                p.y = 0;
        }
        return p;
}

bool Grid::contains(const Point &p) const
{
        return p.x >= 0 && p.y >= 0 && p.x < width && p.y < height;
}

Point grid_to_pixel(const Point &cell)
{
        return {.x = cell.x * TILE_SIZE,
                .y = cell.y * TILE_SIZE + SCORE_BAR_HEIGHT};
}
