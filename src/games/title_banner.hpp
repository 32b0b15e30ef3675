#pragma once
#include "snake_common.hpp"
#include <vector>

namespace SnakeDefinitions
{
/**
 * Builds the five static snakes spelling "SNAKE" on the main menu. Each letter
 * is a regular body spawned at a fixed cell and shaped by a movement script.
 * Script characters select the direction (u, d, l, r); lowercase moves the
 * whole snake (the tail follows), uppercase extends the head only.
 */
std::vector<Body> build_title_banner(const Grid &grid);

/**
 * Applies a single letter script to the body. Returns false and stops at the
 * first character that is not a valid move.
 */
bool apply_banner_script(Body *body, const char *script);

} // namespace SnakeDefinitions
