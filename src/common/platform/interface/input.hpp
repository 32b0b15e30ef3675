#pragma once
/**
 * Enum modeling the four possible directions of user input. The same enum is
 * used for the direction a snake segment is facing.
 */
typedef enum Direction { UP = 0, RIGHT = 1, DOWN = 2, LEFT = 3 } Direction;

bool is_opposite(const Direction direction, const Direction other_direction);
/**
 * Returns true if the two directions are at a right angle, e.g. UP and LEFT.
 */
bool is_perpendicular(const Direction direction,
                      const Direction other_direction);
Direction get_opposite(const Direction direction);

/**
 * Enum for the discrete 'user actions' that the game reacts to apart from
 * the directional input.
 */
typedef enum Action { START = 0, TO_MENU = 1, QUIT = 2 } Action;

const char *direction_to_str(Direction direction);
const char *action_to_str(Action action);
