#pragma once

#include "../common/configuration.hpp"
#include "../common/platform/interface/platform.hpp"
#include "session.hpp"
#include <optional>

/**
 * Polls all controllers of the platform once and translates the registered
 * input into the events consumed by the session state machine.
 */
SnakeDefinitions::InputEvents collect_input_events(Platform *p);

/**
 * Runs the snake game until the player quits or the window is closed. Every
 * iteration polls the input, advances the session by one tick, renders the
 * frame and waits for `config.tick_delay_ms`.
 */
std::optional<UserAction> snake_loop(Platform *p,
                                     const SnakeConfiguration &config);
