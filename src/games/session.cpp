#include "session.hpp"
#include "../common/logging.hpp"
#include "movement.hpp"
#include <stdlib.h>

#define TAG "session"

namespace SnakeDefinitions
{
const char *phase_to_str(Phase phase)
{
        switch (phase) {
        case Phase::MainMenu:
                return "MainMenu";
        case Phase::Countdown:
                return "Countdown";
        case Phase::Playing:
                return "Playing";
        case Phase::Dying:
                return "Dying";
        case Phase::GameOver:
                return "GameOver";
        default:
                return "Unknown";
        }
}

SessionState create_session(const SnakeConfiguration &config)
{
        Grid grid(config.board_width, config.board_height);
        SessionState session = {
            .config = config,
            .grid = grid,
            .phase = Phase::MainMenu,
            .body = Body::spawn(grid, grid.width / 2, grid.height / 2),
            .food = {.position = {.x = 0, .y = 0}},
            .current_direction = UP,
            .tick_counter = 0,
            .ticks_per_move = config.initial_ticks_per_move,
            .countdown_value = config.countdown_start,
            .countdown_ticks = 0,
            .score = 0,
            .skeleton_ticks = 0,
            .tongue_out = false,
            .tongue_ticks = 0,
        };
        change_phase(&session, Phase::MainMenu);
        return session;
}

void reset_session(SessionState *session)
{
        const SnakeConfiguration &config = session->config;
        Grid &grid = session->grid;

        session->body = Body::spawn(grid, grid.width / 2, grid.height / 2);
        auto maybe_food = place_food(grid, session->body);
        if (maybe_food) {
                session->food = maybe_food.value();
        } else {
                LOG_WARN(TAG, "No room for food on a fresh board of %dx%d",
                         grid.width, grid.height);
        }

        session->current_direction = UP;
        session->tick_counter = 0;
        session->ticks_per_move = config.initial_ticks_per_move;
        session->countdown_value = config.countdown_start;
        session->countdown_ticks = 0;
        session->score = 0;
        session->skeleton_ticks = 0;
        session->tongue_out = false;
        session->tongue_ticks = 0;
        LOG_DEBUG(TAG, "Session reset");
}

void change_phase(SessionState *session, Phase phase)
{
        LOG_INFO(TAG, "Phase transition: %s -> %s",
                 phase_to_str(session->phase), phase_to_str(phase));

        switch (phase) {
        case Phase::MainMenu: {
                reset_session(session);
                int pregrowth = rand() % session->config.max_menu_pregrowth;
                for (int i = 0; i < pregrowth; i++) {
                        Direction facing = session->body.head().facing;
                        session->body.advance(random_snake_direction(facing));
                }
                session->ticks_per_move = session->config.menu_ticks_per_move;
                LOG_DEBUG(TAG, "Menu snake grown to %d segments",
                          session->body.length());
                break;
        }
        case Phase::Countdown:
                reset_session(session);
                break;
        case Phase::Dying:
                session->skeleton_ticks = 0;
                break;
        case Phase::Playing:
        case Phase::GameOver:
                break;
        }
        session->phase = phase;
}

/**
 * The tongue of the snake flickers in and out at random.
 */
void update_tongue(SessionState *session)
{
        session->tongue_ticks++;
        if (session->tongue_ticks < session->config.tongue_toggle_ticks) {
                return;
        }
        session->tongue_ticks = 0;

        if (session->tongue_out) {
                session->tongue_out = false;
        } else if (rand() % 100 < session->config.tongue_show_chance_percent) {
                session->tongue_out = true;
        }
}

void update_main_menu(SessionState *session, const InputEvents &events)
{
        if (events.start) {
                change_phase(session, Phase::Countdown);
                return;
        }

        session->tick_counter++;
        if (session->tick_counter >= session->ticks_per_move) {
                session->tick_counter = 0;
                Direction facing = session->body.head().facing;
                StepResult result =
                    move_body(&session->body, random_snake_direction(facing));
                if (result == StepResult::InvalidState) {
                        LOG_ERROR(TAG, "Menu snake could not move, resetting "
                                       "the main menu.");
                        change_phase(session, Phase::MainMenu);
                        return;
                }
        }

        update_tongue(session);
}

void update_countdown(SessionState *session)
{
        session->countdown_ticks++;
        if (session->countdown_ticks >=
            session->config.ticks_per_countdown_step) {
                session->countdown_value--;
                session->countdown_ticks = 0;
                LOG_DEBUG(TAG, "Countdown: %d", session->countdown_value);
        }

        if (session->countdown_value < 0) {
                change_phase(session, Phase::Playing);
        }
}

void update_playing(SessionState *session, const InputEvents &events)
{
        if (events.direction.has_value()) {
                Direction requested = events.direction.value();
                Direction facing = session->body.head().facing;
                if (is_valid_direction_change(facing, requested)) {
                        session->current_direction = requested;
                }
        }

        session->tick_counter++;
        if (session->tick_counter >= session->ticks_per_move) {
                session->tick_counter = 0;
                StepResult result = take_snake_step(
                    session->grid, &session->body, &session->food,
                    &session->score, session->current_direction, true, true);

                switch (result) {
                case StepResult::Collision:
                        change_phase(session, Phase::Dying);
                        return;
                case StepResult::InvalidState:
                        LOG_ERROR(TAG, "Snake body is in an invalid state, "
                                       "ending the game.");
                        change_phase(session, Phase::GameOver);
                        return;
                case StepResult::AteFood:
                case StepResult::Moved:
                        break;
                }
                session->ticks_per_move =
                    ticks_per_move_for_score(session->score);
        }

        update_tongue(session);
}

void update_dying(SessionState *session)
{
        session->skeleton_ticks++;
        if (session->skeleton_ticks <
            session->config.ticks_per_skeleton_segment) {
                return;
        }
        session->skeleton_ticks = 0;

        session->body.mark_next_skeleton();
        if (session->body.all_skeleton()) {
                change_phase(session, Phase::GameOver);
        }
}

void update_game_over(SessionState *session, const InputEvents &events)
{
        if (events.start) {
                change_phase(session, Phase::Countdown);
        } else if (events.to_menu) {
                change_phase(session, Phase::MainMenu);
        }
}

std::optional<UserAction> update_session(SessionState *session,
                                         const InputEvents &events)
{
        if (events.quit) {
                LOG_INFO(TAG, "Quit requested in phase %s, final score: %d",
                         phase_to_str(session->phase), session->score);
                return UserAction::Exit;
        }

        switch (session->phase) {
        case Phase::MainMenu:
                update_main_menu(session, events);
                break;
        case Phase::Countdown:
                update_countdown(session);
                break;
        case Phase::Playing:
                update_playing(session, events);
                break;
        case Phase::Dying:
                update_dying(session);
                break;
        case Phase::GameOver:
                update_game_over(session, events);
                break;
        }
        return std::nullopt;
}

} // namespace SnakeDefinitions
