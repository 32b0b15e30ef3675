#include "common_transitions.hpp"
#include "../common/constants.hpp"
#include <stdio.h>
#include <string.h>

void draw_centered_text(Display *display, const char *text, int y_pos,
                        Color bg_color, Color fg_color)
{
        int width = display->get_width();
        int x_pos = (width - (int)strlen(text) * FONT_WIDTH) / 2;
        Point text_position = {.x = x_pos, .y = y_pos};

        display->draw_string(text_position, text, Size12, bg_color, fg_color);
}

void display_countdown(Display *display, int countdown_value)
{
        char msg[8];
        if (countdown_value > 0) {
                snprintf(msg, sizeof(msg), "%d", countdown_value);
        } else {
                snprintf(msg, sizeof(msg), "GO!");
        }

        int height = display->get_height();
        int y_pos = (height - FONT_SIZE) / 2;
        draw_centered_text(display, msg, y_pos, Black, Yellow);
}

void display_game_over(Display *display)
{
        const char *lines[] = {"SPACE: New Game", "ESC: Main Menu", "Q: Quit"};

        int height = display->get_height();
        int y_pos = (height - FONT_SIZE) / 2 - 2 * FONT_SIZE;

        draw_centered_text(display, "GAME OVER!", y_pos, Black, Red);

        for (const char *line : lines) {
                y_pos += 2 * FONT_SIZE;
                draw_centered_text(display, line, y_pos, Black, White);
        }
}

void display_main_menu_hints(Display *display)
{
        const char *lines[] = {
            "UP/DOWN/LEFT/RIGHT: Change direction of snake",
            "Q: Quit",
            "SPACE: Start Game",
            "Eat the cupcakes, but not yourself!",
        };

        int height = display->get_height();
        // The title banner takes up the upper half of the board.
        int y_pos = height / 2 + 2 * FONT_SIZE;

        for (const char *line : lines) {
                draw_centered_text(display, line, y_pos, Black, White);
                y_pos += FONT_SIZE + FONT_SIZE / 2;
        }
}
