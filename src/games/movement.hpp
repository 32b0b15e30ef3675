#pragma once
#include "food_placement.hpp"
#include "snake_common.hpp"

/* Speed law of the player-controlled snake: the number of ticks between two
 * moves starts at the base value and drops by one per point scored until it
 * reaches the floor. */
#define SPEED_LAW_BASE_TICKS 40
#define SPEED_LAW_MIN_TICKS 7

namespace SnakeDefinitions
{
enum class StepResult {
        Moved,
        AteFood,
        // The move was not applied because the head would bite the body.
        Collision,
        // The body refused the move, see `BodyError::InvalidState`.
        InvalidState,
};

const char *step_result_to_str(StepResult result);

/**
 * Moves the body one cell along `direction` without any death or food checks.
 * If the body has pending growth, the tail stays in place and the flag is
 * cleared, otherwise the tail is removed before the new head is pushed.
 */
StepResult move_body(Body *body, Direction direction);

/**
 * Performs a single movement tick of the snake:
 * 1. If `check_death` is set and the move would make the snake bite itself,
 *    the body is left untouched and `StepResult::Collision` is returned.
 * 2. Otherwise the body is moved (see `move_body`).
 * 3. If `check_food` is set and the new head sits on the food, the score is
 *    incremented, growth is scheduled for the next move and the food is
 *    placed on a new free cell.
 */
StepResult take_snake_step(const Grid &grid, Body *body, Food *food,
                           int *score, Direction direction, bool check_death,
                           bool check_food);

/**
 * A requested direction is accepted only if it is perpendicular to the
 * direction that the head is facing. This rejects both repeated presses of
 * the current direction and reversals into the neck.
 */
bool is_valid_direction_change(Direction facing, Direction requested);

int ticks_per_move_for_score(int score);

/**
 * Direction for the snake roaming around the main menu: with even odds it
 * keeps going straight, otherwise it turns into one of the two perpendicular
 * directions chosen uniformly.
 */
Direction random_snake_direction(Direction current);

} // namespace SnakeDefinitions
