/* Definitions of constants that are shared between the game logic and the
 * platform implementations. */
#pragma once

/* Size of a single square tile of the board in pixels. */
#define TILE_SIZE 16

/* The score bar is rendered above the board, every board tile is shifted
 * down by its height. */
#define SCORE_BAR_HEIGHT 16

#define FONT_SIZE 12

// The emulator font is monospaced, this is the advance of a single character
// for the FONT_SIZE above. It is used to center text horizontally.
#define FONT_WIDTH 7

constexpr int BOARD_WIDTH = 27;
constexpr int BOARD_HEIGHT = 20;

constexpr int DISPLAY_WIDTH = BOARD_WIDTH * TILE_SIZE;
constexpr int DISPLAY_HEIGHT = BOARD_HEIGHT * TILE_SIZE + SCORE_BAR_HEIGHT;

/* The emulator window is scaled up so that the 16px tiles remain readable. */
constexpr int WINDOW_SCALE = 2;
