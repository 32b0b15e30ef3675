#pragma once
#include "../common/platform/interface/display.hpp"
#include "render_projection.hpp"

/**
 * Draws a complete frame of the snake game onto the display: the score bar,
 * the food, the snake (or the title banner and the roaming snake in the main
 * menu) and the phase-specific text overlays. The display is not refreshed,
 * this is left to the game loop.
 */
void render_frame(Display *display,
                  const SnakeDefinitions::FrameProjection &frame);

/**
 * Draws a single snake segment in the tile at `cell`. The tile shape is
 * defined pointing up (bends connect the left and bottom edges) and rotated
 * clockwise about the centre of the tile.
 */
void render_segment(Display *display,
                    const SnakeDefinitions::SegmentSprite &sprite, Color color);

/**
 * Rotates a point given relative to the top left corner of a tile clockwise
 * about the tile centre.
 */
Point rotate_in_tile(Point p, SnakeDefinitions::Rotation rotation);
