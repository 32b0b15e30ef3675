#include "input.hpp"

const char *direction_to_str(Direction direction)
{
        switch (direction) {
        case UP:
                return "Up";
        case LEFT:
                return "Left";
        case RIGHT:
                return "Right";
        case DOWN:
                return "Down";
        default:
                return "Unknown";
        };
};

bool is_opposite(const Direction direction, const Direction other_direction)
{
        switch (direction) {
        case UP:
                return other_direction == DOWN;
        case RIGHT:
                return other_direction == LEFT;
        case DOWN:
                return other_direction == UP;
        case LEFT:
                return other_direction == RIGHT;
        }
        return false;
}

bool is_perpendicular(const Direction direction,
                      const Direction other_direction)
{
        return direction != other_direction &&
               !is_opposite(direction, other_direction);
}

Direction get_opposite(const Direction direction)
{
        switch (direction) {
        case UP:
                return DOWN;
        case RIGHT:
                return LEFT;
        case DOWN:
                return UP;
        case LEFT:
                return RIGHT;
        }
        return direction;
}

const char *action_to_str(Action action)
{
        switch (action) {
        case START:
                return "Start";
        case TO_MENU:
                return "ToMenu";
        case QUIT:
                return "Quit";
        default:
                return "Unknown";
        };
};
