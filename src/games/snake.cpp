#include "snake.hpp"
#include "render_projection.hpp"
#include "snake_renderer.hpp"
#include "title_banner.hpp"

#include "../common/logging.hpp"

#define TAG "snake"

using namespace SnakeDefinitions;

InputEvents collect_input_events(Platform *p)
{
        InputEvents events = {.direction = std::nullopt,
                              .start = false,
                              .to_menu = false,
                              .quit = false};

        Direction dir;
        if (poll_directional_input(p->directional_controllers, &dir)) {
                events.direction = dir;
        }

        Action act;
        if (poll_action_input(p->action_controllers, &act)) {
                LOG_TRACE(TAG, "Action registered: %s", action_to_str(act));
                switch (act) {
                case START:
                        events.start = true;
                        break;
                case TO_MENU:
                        events.to_menu = true;
                        break;
                case QUIT:
                        events.quit = true;
                        break;
                }
        }
        return events;
}

std::optional<UserAction> snake_loop(Platform *p,
                                     const SnakeConfiguration &config)
{
        LOG_DEBUG(TAG, "Entering Snake game loop");
        log_configuration(config);

        SessionState session = create_session(config);
        std::vector<Body> banner = build_title_banner(session.grid);

        while (true) {
                InputEvents events = collect_input_events(p);

                auto maybe_action = update_session(&session, events);
                if (maybe_action) {
                        return maybe_action;
                }

                render_frame(p->display, project_frame(session, banner));

                // On the SFML display this also processes the window events,
                // once the window is closed the game cannot continue.
                if (!p->display->refresh()) {
                        LOG_DEBUG(TAG, "Display closed, leaving the game loop");
                        return UserAction::CloseWindow;
                }
                p->delay_provider->delay_ms(config.tick_delay_ms);
        }
}
