#ifdef EMULATOR
#include "emulator_config.h"

#include "src/common/configuration.hpp"
#include "src/common/constants.hpp"
#include "src/common/platform/emulator/emulator_delay.hpp"
#include "src/common/platform/emulator/font_provider.hpp"
#include "src/common/platform/emulator/sfml_controller.hpp"
#include "src/common/platform/emulator/sfml_display.hpp"
#include "src/common/platform/interface/platform.hpp"

#include "src/common/logging.hpp"

#include "src/games/snake.hpp"

#include <iostream>
#include <stdlib.h>
#include <string.h>
#include <string>
#include <time.h>

#define TAG "emulator_entrypoint"

typedef struct EmulatorArguments {
        std::string font_path;
        unsigned int seed;
} EmulatorArguments;

void print_version(char *argv[]);
bool parse_arguments(int argc, char *argv[], EmulatorArguments *args);

int main(int argc, char *argv[])
{
        print_version(argv);

        EmulatorArguments args = {.font_path = DEFAULT_FONT_PATH,
                                  .seed = (unsigned int)time(NULL)};
        if (!parse_arguments(argc, argv, &args)) {
                std::cerr << "Usage: " << argv[0]
                          << " [font_path] [--seed N]" << std::endl;
                return 1;
        }
        srand(args.seed);
        LOG_DEBUG(TAG, "Random seed: %u", args.seed);

        auto maybe_font = load_emulator_font(args.font_path);
        if (!maybe_font) {
                LOG_ERROR(TAG, "Aborting, the emulator cannot run without a "
                               "font.");
                return 1;
        }
        sf::Font font = maybe_font.value();

        sf::RenderWindow window(
            sf::VideoMode({(unsigned int)(DISPLAY_WIDTH * WINDOW_SCALE),
                           (unsigned int)(DISPLAY_HEIGHT * WINDOW_SCALE)}),
            "cupcake-snake");

        // Shapes are drawn into the texture by the game and the texture is
        // copied onto the window once per frame.
        sf::RenderTexture texture(
            {(unsigned int)DISPLAY_WIDTH, (unsigned int)DISPLAY_HEIGHT});

        LOG_DEBUG(TAG, "Window rendered!");

        SfmlDisplay display(&window, &texture, &font);
        display.setup();

        EmulatorDelay delay;
        SfmlInputController controller;
        SfmlActionInputController action_controller;
        controller.setup();
        action_controller.setup();

        std::vector<DirectionalController *> controllers = {&controller};
        std::vector<ActionController *> action_controllers = {
            &action_controller};

        Platform platform = {.display = &display,
                             .directional_controllers = &controllers,
                             .action_controllers = &action_controllers,
                             .delay_provider = &delay};

        auto maybe_action = snake_loop(&platform, DEFAULT_SNAKE_CONFIG);
        if (maybe_action) {
                LOG_DEBUG(TAG, "Game loop finished: %s",
                          user_action_to_str(maybe_action.value()));
        }
        if (window.isOpen()) {
                window.close();
        }
        return 0;
}

bool parse_arguments(int argc, char *argv[], EmulatorArguments *args)
{
        for (int i = 1; i < argc; i++) {
                if (strcmp(argv[i], "--seed") == 0) {
                        if (i + 1 >= argc) {
                                LOG_ERROR(TAG, "--seed requires a value");
                                return false;
                        }
                        char *end;
                        unsigned long seed = strtoul(argv[++i], &end, 10);
                        if (*end != '\0') {
                                LOG_ERROR(TAG, "Invalid seed: %s", argv[i]);
                                return false;
                        }
                        args->seed = (unsigned int)seed;
                } else {
                        args->font_path = argv[i];
                }
        }
        return true;
}

void print_version(char *argv[])
{
        std::cout << argv[0] << " Version: " << CUPCAKE_SNAKE_VERSION_MAJOR
                  << "." << CUPCAKE_SNAKE_VERSION_MINOR << std::endl;
}
#endif // EMULATOR
