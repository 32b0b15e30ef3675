#include "configuration.hpp"
#include "constants.hpp"
#include "logging.hpp"

#define TAG "configuration"

const SnakeConfiguration DEFAULT_SNAKE_CONFIG = {
    .board_width = BOARD_WIDTH,
    .board_height = BOARD_HEIGHT,
    .initial_ticks_per_move = 30,
    .menu_ticks_per_move = 5,
    .countdown_start = 3,
    .ticks_per_countdown_step = 60,
    .ticks_per_skeleton_segment = 2,
    .tongue_toggle_ticks = 20,
    .tongue_show_chance_percent = 30,
    .max_menu_pregrowth = 100,
    // Roughly 60 ticks per second.
    .tick_delay_ms = 16,
};

const char *user_action_to_str(UserAction action)
{
        switch (action) {
        case UserAction::Exit:
                return "Exit";
        case UserAction::CloseWindow:
                return "CloseWindow";
        default:
                return "Unknown";
        }
}

void log_configuration(const SnakeConfiguration &config)
{
        LOG_DEBUG(TAG,
                  "Snake configuration: board=%dx%d, initial_ticks_per_move=%d, "
                  "menu_ticks_per_move=%d, countdown_start=%d, "
                  "ticks_per_countdown_step=%d, ticks_per_skeleton_segment=%d, "
                  "tongue_toggle_ticks=%d, tongue_show_chance_percent=%d, "
                  "max_menu_pregrowth=%d, tick_delay_ms=%d",
                  config.board_width, config.board_height,
                  config.initial_ticks_per_move, config.menu_ticks_per_move,
                  config.countdown_start, config.ticks_per_countdown_step,
                  config.ticks_per_skeleton_segment, config.tongue_toggle_ticks,
                  config.tongue_show_chance_percent, config.max_menu_pregrowth,
                  config.tick_delay_ms);
}
