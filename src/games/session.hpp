#pragma once
#include "../common/configuration.hpp"
#include "food_placement.hpp"
#include "snake_common.hpp"
#include <optional>

namespace SnakeDefinitions
{
enum class Phase {
        // Title screen with a snake roaming around on its own.
        MainMenu,
        // Countdown before the player takes control.
        Countdown,
        // The player steers the snake and eats food.
        Playing,
        // The snake bit itself and is turning into a skeleton.
        Dying,
        GameOver,
};

const char *phase_to_str(Phase phase);

/**
 * Discrete input events collected by the host once per tick.
 */
typedef struct InputEvents {
        std::optional<Direction> direction;
        bool start;
        bool to_menu;
        bool quit;
} InputEvents;

/**
 * State of a single game session. It owns the body and the food of the game
 * that is currently displayed (the decorative snake of the main menu included).
 */
typedef struct SessionState {
        SnakeConfiguration config;
        Grid grid;
        Phase phase;
        Body body;
        Food food;
        /**
         * Direction that the player snake will move along on its next move.
         */
        Direction current_direction;
        /**
         * Ticks elapsed since the last move of the snake.
         */
        int tick_counter;
        int ticks_per_move;
        int countdown_value;
        int countdown_ticks;
        int score;
        /**
         * Ticks elapsed since the last segment turned into a skeleton.
         */
        int skeleton_ticks;
        bool tongue_out;
        int tongue_ticks;
} SessionState;

/**
 * Creates a new session and enters the main menu.
 */
SessionState create_session(const SnakeConfiguration &config);

/**
 * Advances the session by a single tick. Returns `UserAction::Exit` if the
 * player asked to quit, otherwise `std::nullopt`.
 */
std::optional<UserAction> update_session(SessionState *session,
                                         const InputEvents &events);

/**
 * Switches the session to a new phase. Entering the main menu or the countdown
 * resets the session first; the main menu snake is additionally grown by a
 * random number of segments and moves at the fast menu cadence.
 */
void change_phase(SessionState *session, Phase phase);

/**
 * Spawns a fresh snake in the middle of the board, places new food and resets
 * the score, speed, countdown and animation counters.
 */
void reset_session(SessionState *session);

} // namespace SnakeDefinitions
