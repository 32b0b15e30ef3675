#include "food_placement.hpp"
#include "../common/logging.hpp"
#include <stdlib.h>
#include <vector>

#define TAG "food_placement"

namespace SnakeDefinitions
{
std::optional<Food> place_food_on_free_cell(const Grid &grid, const Body &body);

std::optional<Food> place_food(const Grid &grid, const Body &body)
{
        for (int attempt = 0; attempt < RANDOM_FOOD_PLACEMENT_ATTEMPTS;
             attempt++) {
                int x = rand() % grid.width;
                int y = rand() % grid.height;

                if (!body.occupies({.x = x, .y = y})) {
                        LOG_DEBUG(TAG, "Placed food at {x: %d, y: %d}", x, y);
                        return Food{.position = {.x = x, .y = y}};
                }
        }

        LOG_WARN(TAG,
                 "No free cell found after %d random attempts, enumerating "
                 "free cells.",
                 RANDOM_FOOD_PLACEMENT_ATTEMPTS);
        return place_food_on_free_cell(grid, body);
}

std::optional<Food> place_food_on_free_cell(const Grid &grid, const Body &body)
{
        std::vector<std::vector<bool>> occupied(
            grid.height, std::vector<bool>(grid.width, false));
        for (const Segment &segment : body.segments()) {
                occupied[segment.position.y][segment.position.x] = true;
        }

        std::vector<Point> free_cells;
        for (int y = 0; y < grid.height; y++) {
                for (int x = 0; x < grid.width; x++) {
                        if (!occupied[y][x]) {
                                free_cells.push_back({.x = x, .y = y});
                        }
                }
        }

        if (free_cells.empty()) {
                LOG_WARN(TAG, "The snake covers the whole board, there is no "
                              "space left for food.");
                return std::nullopt;
        }

        Point chosen = free_cells[rand() % free_cells.size()];
        LOG_DEBUG(TAG, "Placed food at {x: %d, y: %d} out of %zu free cells",
                  chosen.x, chosen.y, free_cells.size());
        return Food{.position = chosen};
}

} // namespace SnakeDefinitions
