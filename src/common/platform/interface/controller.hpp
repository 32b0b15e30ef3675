#pragma once

#include "input.hpp"
#include <vector>

class DirectionalController
{
      public:
        virtual ~DirectionalController() {}
        /**
         * For a given controller, this function will inspect its state to
         * determine if an input is being entered. Note that this function
         * only tests for the state of the controller right now (it doesn't
         * poll for a period of time). Because of this, it is called once per
         * tick of the game loop.
         *
         * If an input is registered, it will be written into the `Direction
         * *input` parameter and `true` will be returned.
         *
         * If no input is registered, this function returns false and the
         * direction pointer remains unchanged.
         */
        virtual bool poll_for_input(Direction *input) = 0;

        /**
         * Setup function used for e.g. initializing the underlying input
         * device. This is to be called only once at startup.
         */
        virtual void setup() = 0;
};

class ActionController
{
      public:
        virtual ~ActionController() {}
        /**
         * Same as `DirectionalController::poll_for_input` but for the discrete
         * actions. If several actions are active at the same time, the
         * controller reports the one with the highest priority (`QUIT` wins
         * over everything else).
         */
        virtual bool poll_for_input(Action *input) = 0;

        virtual void setup() = 0;
};

extern bool
poll_directional_input(std::vector<DirectionalController *> *controllers,
                       Direction *registered_dir);

extern bool poll_action_input(std::vector<ActionController *> *controllers,
                              Action *registered_action);
