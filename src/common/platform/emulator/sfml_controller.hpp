#pragma once
#ifdef EMULATOR
#include "../interface/controller.hpp"

/**
 * Reads the arrow keys of the keyboard.
 */
class SfmlInputController : public DirectionalController
{
      public:
        bool poll_for_input(Direction *input) override;
        void setup() override;
};

/**
 * Maps Space to `START`, Escape to `TO_MENU` and Q to `QUIT`. Q is checked
 * first so that quitting always wins.
 */
class SfmlActionInputController : public ActionController
{
      public:
        bool poll_for_input(Action *input) override;
        void setup() override;
};
#endif
