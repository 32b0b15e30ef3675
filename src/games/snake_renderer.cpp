#include "snake_renderer.hpp"
#include "../common/constants.hpp"
#include "../common/grid.hpp"
#include "../common/logging.hpp"
#include "common_transitions.hpp"
#include <algorithm>
#include <stdio.h>
#include <stdlib.h>

#define TAG "snake_renderer"

#define TILE_CENTER (TILE_SIZE / 2)

using namespace SnakeDefinitions;

typedef struct TileRect {
        int x;
        int y;
        int width;
        int height;
} TileRect;

typedef struct TileCircle {
        Point center;
        int radius;
} TileCircle;

// Shapes of the sprites in their default orientation, in tile coordinates.
static const TileRect HEAD_NECK = {3, 8, 10, 8};
static const TileCircle HEAD_SKULL = {{8, 8}, 5};
static const TileCircle LEFT_EYE = {{6, 6}, 1};
static const TileCircle RIGHT_EYE = {{10, 6}, 1};
static const TileRect TONGUE = {7, 0, 2, 3};

static const TileRect BODY_STRAIGHT = {3, 0, 10, 16};

static const TileRect BEND_HORIZONTAL = {0, 3, 13, 10};
static const TileRect BEND_VERTICAL = {3, 3, 10, 13};

static const TileRect TAIL_STUMP = {5, 0, 6, 10};
static const TileCircle TAIL_TIP = {{8, 10}, 3};

typedef struct SnakePalette {
        Color body;
        Color skeleton;
} SnakePalette;

static const SnakePalette DEFAULT_PALETTE = {.body = Green, .skeleton = LGray};
static const SnakePalette DIMMED_PALETTE = {.body = DarkGreen,
                                            .skeleton = Gray};

Point rotate_in_tile(Point p, Rotation rotation)
{
        int dx = p.x - TILE_CENTER;
        int dy = p.y - TILE_CENTER;
        switch (rotation) {
        case Rotation::Deg0:
                break;
        case Rotation::Deg90: {
                int tmp = dx;
                dx = -dy;
                dy = tmp;
                break;
        }
        case Rotation::Deg180:
                dx = -dx;
                dy = -dy;
                break;
        case Rotation::Deg270: {
                int tmp = dx;
                dx = dy;
                dy = -tmp;
                break;
        }
        }
        return {.x = TILE_CENTER + dx, .y = TILE_CENTER + dy};
}

static void draw_tile_rectangle(Display *display, Point tile_origin,
                                const TileRect &rect, Rotation rotation,
                                Color color)
{
        Point first = rotate_in_tile({.x = rect.x, .y = rect.y}, rotation);
        Point second = rotate_in_tile(
            {.x = rect.x + rect.width, .y = rect.y + rect.height}, rotation);

        Point start = {.x = tile_origin.x + std::min(first.x, second.x),
                       .y = tile_origin.y + std::min(first.y, second.y)};
        display->draw_rectangle(start, abs(second.x - first.x),
                                abs(second.y - first.y), color, 0, true);
}

static void draw_tile_circle(Display *display, Point tile_origin,
                             const TileCircle &circle, Rotation rotation,
                             Color color)
{
        Point center = rotate_in_tile(circle.center, rotation);
        display->draw_circle(
            {.x = tile_origin.x + center.x, .y = tile_origin.y + center.y},
            circle.radius, color, 0, true);
}

void render_segment(Display *display, const SegmentSprite &sprite, Color color)
{
        Point origin = grid_to_pixel(sprite.cell);
        Rotation rotation = sprite.rotation;

        switch (sprite.type) {
        case TileType::Head:
                draw_tile_rectangle(display, origin, HEAD_NECK, rotation,
                                    color);
                draw_tile_circle(display, origin, HEAD_SKULL, rotation, color);
                draw_tile_circle(display, origin, LEFT_EYE, rotation, Black);
                draw_tile_circle(display, origin, RIGHT_EYE, rotation, Black);
                if (sprite.has_tongue_out) {
                        draw_tile_rectangle(display, origin, TONGUE, rotation,
                                            Red);
                }
                break;
        case TileType::Body:
                draw_tile_rectangle(display, origin, BODY_STRAIGHT, rotation,
                                    color);
                break;
        case TileType::Bend:
                draw_tile_rectangle(display, origin, BEND_HORIZONTAL, rotation,
                                    color);
                draw_tile_rectangle(display, origin, BEND_VERTICAL, rotation,
                                    color);
                break;
        case TileType::Tail:
                draw_tile_rectangle(display, origin, TAIL_STUMP, rotation,
                                    color);
                draw_tile_circle(display, origin, TAIL_TIP, rotation, color);
                break;
        }
}

static void render_snake(Display *display,
                         const std::vector<SegmentSprite> &snake,
                         const SnakePalette &palette)
{
        // Drawn tail first so that the head ends up on top.
        for (auto it = snake.rbegin(); it != snake.rend(); it++) {
                Color color = it->is_skeleton ? palette.skeleton : palette.body;
                render_segment(display, *it, color);
        }
}

static void render_food(Display *display, Point cell)
{
        Point origin = grid_to_pixel(cell);
        // Cupcake: cream wrapper, pink frosting and a cherry on top.
        display->draw_rectangle({.x = origin.x + 4, .y = origin.y + 9}, 8, 6,
                                Cream, 0, true);
        display->draw_circle({.x = origin.x + 8, .y = origin.y + 8}, 5, Pink,
                             0, true);
        display->draw_circle({.x = origin.x + 8, .y = origin.y + 2}, 2, Red, 0,
                             true);
}

static void render_score_bar(Display *display, int score)
{
        display->draw_rectangle({.x = 0, .y = 0}, display->get_width(),
                                SCORE_BAR_HEIGHT, Midnight, 0, true);

        char score_text[32];
        snprintf(score_text, sizeof(score_text), "Calories: %d",
                 calories_for_score(score));
        draw_centered_text(display, score_text,
                           (SCORE_BAR_HEIGHT - FONT_SIZE) / 2, Midnight,
                           White);
}

void render_frame(Display *display, const FrameProjection &frame)
{
        display->clear(Black);
        render_score_bar(display, frame.score);

        if (frame.show_food) {
                render_food(display, frame.food);
        }

        const SnakePalette &palette =
            frame.dimmed ? DIMMED_PALETTE : DEFAULT_PALETTE;

        switch (frame.phase) {
        case Phase::MainMenu:
                render_snake(display, frame.snake, DIMMED_PALETTE);
                for (const auto &letter : frame.banner) {
                        for (const SegmentSprite &sprite : letter) {
                                render_segment(display, sprite, LightBlue);
                        }
                }
                display_main_menu_hints(display);
                break;
        case Phase::Countdown:
                render_snake(display, frame.snake, palette);
                display_countdown(display, frame.countdown_value);
                break;
        case Phase::Playing:
        case Phase::Dying:
                render_snake(display, frame.snake, palette);
                break;
        case Phase::GameOver:
                render_snake(display, frame.snake, palette);
                display_game_over(display);
                break;
        }
        LOG_TRACE(TAG, "Rendered frame in phase %s",
                  phase_to_str(frame.phase));
}
