#pragma once
#ifdef EMULATOR
#include "../interface/display.hpp"
#include <SFML/Graphics.hpp>

/**
 * Display implementation backed by an SFML window. Shapes are drawn into an
 * off-screen render texture which is copied onto the window (scaled up by
 * `WINDOW_SCALE`) on every refresh.
 */
class SfmlDisplay : public Display
{
      public:
        SfmlDisplay(sf::RenderWindow *window, sf::RenderTexture *texture,
                    const sf::Font *font)
            : window(window), texture(texture), font(font)
        {
        }

        void setup() override;
        void clear(Color color) override;
        void draw_circle(Point center, int radius, Color color,
                         int border_width, bool filled) override;
        void draw_rectangle(Point start, int width, int height, Color color,
                            int border_width, bool filled) override;
        void draw_string(Point start, const char *string_buffer,
                         FontSize font_size, Color bg_color,
                         Color fg_color) override;
        int get_height() override;
        int get_width() override;
        bool refresh() override;

      private:
        sf::RenderWindow *window;
        sf::RenderTexture *texture;
        const sf::Font *font;
};

sf::Color map_to_sf_color(Color color);
#endif
