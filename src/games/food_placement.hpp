#pragma once
#include "snake_common.hpp"
#include <optional>

/**
 * Number of random cells that are tried before falling back to enumerating all
 * free cells of the board.
 */
#define RANDOM_FOOD_PLACEMENT_ATTEMPTS 128

namespace SnakeDefinitions
{
typedef struct Food {
        Point position;
} Food;

/**
 * Picks a uniformly random board cell that is not occupied by the snake.
 * Random cells are sampled first; if that keeps hitting the snake (which
 * happens on a nearly full board) the free cells are enumerated explicitly
 * and one of them is chosen at random.
 *
 * Returns `std::nullopt` only if the snake covers the whole board.
 */
std::optional<Food> place_food(const Grid &grid, const Body &body);

} // namespace SnakeDefinitions
