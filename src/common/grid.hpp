#pragma once
#include "point.hpp"

/**
 * Fixed-size board made of square tiles. The board uses toroidal geometry:
 * stepping past one of its edges lands on the opposite edge. The struct itself
 * holds no state apart from its dimensions.
 */
typedef struct Grid {
        int width;
        int height;

        Grid(int w, int h) : width(w), height(h) {}

        /**
         * Brings a point that is at most one cell outside of the board back
         * onto it. For each axis, a coordinate below zero becomes
         * `dimension - 1` and a coordinate at or above the dimension becomes
         * zero. Coordinates inside the board are returned unchanged.
         */
        Point wrap(Point p) const;

        bool contains(const Point &p) const;

        int cell_count() const { return width * height; }
} Grid;

/**
 * Maps a logical board cell onto the pixel location of its top left corner.
 * The board is rendered below the score bar, hence the vertical offset.
 */
Point grid_to_pixel(const Point &cell);
