#pragma once
#include "controller.hpp"
#include "delay.hpp"
#include "display.hpp"
#include <vector>

/**
 * Structure encapsulating all interfaces that a given implementation of the
 * platform needs to provide so that we can run the game on it.
 */
struct Platform {
        Display *display;
        std::vector<DirectionalController *> *directional_controllers;
        std::vector<ActionController *> *action_controllers;
        DelayProvider *delay_provider;
};
