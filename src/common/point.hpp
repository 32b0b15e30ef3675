#pragma once
#include "platform/interface/input.hpp"
typedef struct Point {
        int x;
        int y;

} Point;

inline bool operator==(const Point &p1, const Point &p2)
{
        return p1.x == p2.x && p1.y == p2.y;
}

inline bool operator!=(const Point &p1, const Point &p2) { return !(p1 == p2); }

/**
 * Returns the point one cell away from `p` along `dir`. Note that this does
 * not apply any wrapping, use `Grid::wrap` to bring the result back onto the
 * board.
 */
Point translate_pure(const Point &p, Direction dir);

