#pragma once

/**
 * Actions that make the game loop return control to its caller.
 */
enum class UserAction {
        // The player asked to quit the game.
        Exit,
        // The window hosting the game was closed.
        CloseWindow,
};

const char *user_action_to_str(UserAction action);

typedef struct SnakeConfiguration {
        /**
         * Dimensions of the board in tiles.
         */
        int board_width;
        int board_height;
        /**
         * Number of ticks before the first move of the player snake after the
         * session is reset. Once the snake starts moving, its speed follows
         * `ticks_per_move_for_score`.
         */
        int initial_ticks_per_move;
        /**
         * Number of ticks between moves of the snake roaming around the main
         * menu.
         */
        int menu_ticks_per_move;
        /**
         * The countdown before the game starts goes from this value down to
         * zero and then one step further.
         */
        int countdown_start;
        int ticks_per_countdown_step;
        /**
         * Once the snake bites itself, its segments turn into skeletons one
         * at a time, head first, every `ticks_per_skeleton_segment` ticks.
         */
        int ticks_per_skeleton_segment;
        /**
         * Every `tongue_toggle_ticks` ticks a visible tongue gets hidden and a
         * hidden one is shown with `tongue_show_chance_percent` probability.
         */
        int tongue_toggle_ticks;
        int tongue_show_chance_percent;
        /**
         * Upper bound (exclusive) of the random number of extra segments
         * grown by the main menu snake.
         */
        int max_menu_pregrowth;
        /**
         * Delay between two ticks of the game loop in milliseconds.
         */
        int tick_delay_ms;
} SnakeConfiguration;

extern const SnakeConfiguration DEFAULT_SNAKE_CONFIG;

void log_configuration(const SnakeConfiguration &config);
