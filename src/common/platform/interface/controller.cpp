#include "controller.hpp"

/**
 * Checks if any of the controllers has recorded user input. If so, the input
 * direction will be written into the `registered_dir` output parameter. When
 * several controllers register input, the last one wins.
 */
bool poll_directional_input(std::vector<DirectionalController *> *controllers,
                            Direction *registered_dir)
{
        bool input_registered = false;
        for (DirectionalController *controller : *controllers) {
                input_registered |= controller->poll_for_input(registered_dir);
        }
        return input_registered;
}

/**
 * Same as `poll_directional_input` except that a `QUIT` registered by any of
 * the controllers is never overwritten by a later controller.
 */
bool poll_action_input(std::vector<ActionController *> *controllers,
                       Action *registered_action)
{
        bool input_registered = false;
        for (ActionController *controller : *controllers) {
                Action action;
                if (!controller->poll_for_input(&action)) {
                        continue;
                }
                if (!input_registered || *registered_action != QUIT) {
                        *registered_action = action;
                }
                input_registered = true;
        }
        return input_registered;
}
