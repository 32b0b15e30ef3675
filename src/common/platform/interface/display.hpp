#pragma once
#include "../../font_size.hpp"
#include "../../point.hpp"
#include "color.hpp"

/*
 * @brief Display interface that needs to be implemented by classes that will be
 * used for drawing the game.
 *
 */
class Display
{
      public:
        virtual ~Display() {}
        /**
         * Performs the setup of the display. This is intended for performing
         * initialization of the modules that are responsible for driving the
         * particular implementation of the display. It is intended to be
         * executed only once, before the first frame is drawn.
         */
        virtual void setup() = 0;
        /**
         * Clears the display. This is done by redrawing the entire screen with
         * the specified color.
         */
        virtual void clear(Color color) = 0;
        /**
         * Draws a circle with specified color, border width and fill.
         */
        virtual void draw_circle(Point center, int radius, Color color,
                                 int border_width, bool filled) = 0;
        /**
         * Draws a rectangle with specified color, border width and fill.
         */
        virtual void draw_rectangle(Point start, int width, int height,
                                    Color color, int border_width,
                                    bool filled) = 0;
        /**
         * Prints a string on the display, allows for specifying the font size,
         * color and background color.
         */
        virtual void draw_string(Point start, const char *string_buffer,
                                 FontSize font_size, Color bg_color,
                                 Color fg_color) = 0;

        /**
         * Returns the height of the display.
         */
        virtual int get_height() = 0;

        /**
         * Returns the width of the display.
         */
        virtual int get_width() = 0;

        /**
         * Presents everything drawn since the last refresh. Implementations
         * backed by a window also process its events here. Returns false once
         * the window was closed and nothing more can be displayed.
         */
        virtual bool refresh() = 0;
};
