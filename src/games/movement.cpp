#include "movement.hpp"
#include "../common/logging.hpp"
#include <algorithm>
#include <stdlib.h>

#define TAG "movement"

namespace SnakeDefinitions
{
const char *step_result_to_str(StepResult result)
{
        switch (result) {
        case StepResult::Moved:
                return "Moved";
        case StepResult::AteFood:
                return "AteFood";
        case StepResult::Collision:
                return "Collision";
        case StepResult::InvalidState:
                return "InvalidState";
        default:
                return "Unknown";
        }
}

StepResult move_body(Body *body, Direction direction)
{
        if (body->has_pending_growth()) {
                body->advance(direction);
                body->set_pending_growth(false);
                return StepResult::Moved;
        }

        auto maybe_error = body->remove_tail();
        if (maybe_error) {
                return StepResult::InvalidState;
        }
        body->advance(direction);
        return StepResult::Moved;
}

StepResult take_snake_step(const Grid &grid, Body *body, Food *food,
                           int *score, Direction direction, bool check_death,
                           bool check_food)
{
        if (check_death && body->check_self_collision(direction)) {
                Point next = body->next_head_position(direction);
                LOG_INFO(TAG, "Snake bit itself at {x: %d, y: %d}", next.x,
                         next.y);
                return StepResult::Collision;
        }

        StepResult result = move_body(body, direction);
        if (result != StepResult::Moved) {
                return result;
        }

        if (check_food && body->check_food_eaten(food->position)) {
                *score += 1;
                body->set_pending_growth(true);
                LOG_DEBUG(TAG, "Food eaten, score: %d", *score);

                auto maybe_food = place_food(grid, *body);
                if (maybe_food) {
                        *food = maybe_food.value();
                } else {
                        LOG_WARN(TAG, "Food could not be re-placed, it stays "
                                      "under the head.");
                }
                return StepResult::AteFood;
        }
        return StepResult::Moved;
}

bool is_valid_direction_change(Direction facing, Direction requested)
{
        return is_perpendicular(facing, requested);
}

int ticks_per_move_for_score(int score)
{
        return std::max(SPEED_LAW_BASE_TICKS - score, SPEED_LAW_MIN_TICKS);
}

Direction random_snake_direction(Direction current)
{
        if (rand() % 100 < 50) {
                return current;
        }

        bool first = rand() % 2 == 0;
        switch (current) {
        case UP:
        case DOWN:
                return first ? LEFT : RIGHT;
        case LEFT:
        case RIGHT:
                return first ? UP : DOWN;
        }
        return current;
}

} // namespace SnakeDefinitions
