#pragma once
#include "../common/platform/interface/display.hpp"

/**
 * Draws the text horizontally centred at the given vertical pixel offset.
 */
void draw_centered_text(Display *display, const char *text, int y_pos,
                        Color bg_color, Color fg_color);

/**
 * Countdown overlay shown before the game starts. Displays the counter while
 * it is positive and "GO!" afterwards.
 */
void display_countdown(Display *display, int countdown_value);

void display_game_over(Display *display);

/**
 * Key binding hints rendered below the title banner.
 */
void display_main_menu_hints(Display *display);
