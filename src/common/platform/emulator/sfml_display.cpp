#ifdef EMULATOR
#include "sfml_display.hpp"
#include "../../constants.hpp"
#include "../../logging.hpp"

#define TAG "sfml_display"

void SfmlDisplay::setup()
{
        clear(Black);
        LOG_DEBUG(TAG, "SFML display set up with %dx%d pixels", get_width(),
                  get_height());
}

void SfmlDisplay::clear(Color color) { texture->clear(map_to_sf_color(color)); }

void SfmlDisplay::draw_circle(Point center, int radius, Color color,
                              int border_width, bool filled)
{
        sf::CircleShape circle(radius);
        circle.setPosition(
            {(float)(center.x - radius), (float)(center.y - radius)});

        if (filled) {
                circle.setFillColor(map_to_sf_color(color));
        } else {
                circle.setFillColor(sf::Color::Transparent);
        }

        circle.setOutlineColor(map_to_sf_color(color));
        circle.setOutlineThickness(border_width);
        texture->draw(circle);
}

void SfmlDisplay::draw_rectangle(Point start, int width, int height,
                                 Color color, int border_width, bool filled)
{
        sf::RectangleShape rectangle({(float)width, (float)height});
        rectangle.setPosition({(float)start.x, (float)start.y});
        if (filled) {
                rectangle.setFillColor(map_to_sf_color(color));
        } else {
                rectangle.setFillColor(sf::Color::Transparent);
        }
        rectangle.setOutlineColor(map_to_sf_color(color));
        rectangle.setOutlineThickness(border_width);
        texture->draw(rectangle);
}

void SfmlDisplay::draw_string(Point start, const char *string_buffer,
                              FontSize font_size, Color bg_color,
                              Color fg_color)
{
        // Text is drawn over whatever is underneath it, the background color
        // is only relevant for displays that cannot blend.
        (void)bg_color;
        sf::Text text(*font, string_buffer, font_size);

        text.setFillColor(map_to_sf_color(fg_color));
        text.setPosition({(float)start.x, (float)start.y});
        texture->draw(text);
}

int SfmlDisplay::get_height() { return DISPLAY_HEIGHT; }

int SfmlDisplay::get_width() { return DISPLAY_WIDTH; }

bool SfmlDisplay::refresh()
{
        /* We need this polling when refreshing the display. Without it, linux
        desktop environments (e.g. gnome) think that the game window is not
        responsive and try to get us to force-close it. */
        while (const std::optional event = window->pollEvent()) {
                if (event->is<sf::Event::Closed>()) {
                        window->close();
                        return false;
                }
        }

        texture->display();
        window->clear();
        sf::Sprite sprite(texture->getTexture());
        sprite.setScale({(float)WINDOW_SCALE, (float)WINDOW_SCALE});
        window->draw(sprite);

        // End the current frame and display its contents on screen
        window->display();
        return true;
}

/**
 * The colors are defined using the RGB565 encoding, whereas SFML uses RGB888
 * with the additional opacity channel. This function converts from the
 * RGB565 color to the RGB888 by scaling each channel and setting opacity to 1.
 */
sf::Color map_to_sf_color(Color color)
{
        uint8_t red, green, blue;

        int bitmask_5 = 0b11111;
        int bitmask_6 = 0b111111;

        int original_blue = color & bitmask_5;
        int original_green = (color >> 5) & bitmask_6;
        int original_red = (color >> 11);

        red = (int)((float)original_red / bitmask_5 * 255);
        green = (int)((float)original_green / bitmask_6 * 255);
        blue = (int)((float)original_blue / bitmask_5 * 255);

        return sf::Color(red, green, blue);
}
#endif
