#include "title_banner.hpp"
#include "../common/logging.hpp"
#include "movement.hpp"
#include <ctype.h>

#define TAG "title_banner"

namespace SnakeDefinitions
{
typedef struct BannerLetter {
        char letter;
        Point origin;
        const char *script;
} BannerLetter;

static const BannerLetter BANNER_LETTERS[] = {
    {'S', {.x = 3, .y = 1}, "llDDRRDDDDLLLURRUULLUUUURRR"},
    {'N', {.x = 8, .y = 7}, "uuUUUULLDDDDDDLUUUUUUURRRRDDDDDDD"},
    {'A', {.x = 14, .y = 2}, "ulLDDDDDDLUUUUUUURRRRDDDDDDDLUUUUL"},
    {'K', {.x = 18, .y = 6}, "dlUUUUUUURDDDDDRRDDRUUULLUURRUULD"},
    {'E', {.x = 26, .y = 3}, "llUURRULLLDDDDDDDRRRULLUURR"},
};

static std::optional<Direction> script_direction(char c)
{
        switch (tolower(c)) {
        case 'u':
                return UP;
        case 'd':
                return DOWN;
        case 'l':
                return LEFT;
        case 'r':
                return RIGHT;
        default:
                return std::nullopt;
        }
}

bool apply_banner_script(Body *body, const char *script)
{
        for (const char *c = script; *c != '\0'; c++) {
                auto maybe_direction = script_direction(*c);
                if (!maybe_direction) {
                        LOG_ERROR(TAG, "Invalid banner script character '%c'",
                                  *c);
                        return false;
                }
                Direction direction = maybe_direction.value();

                if (isupper(*c)) {
                        body->advance(direction);
                } else if (move_body(body, direction) ==
                           StepResult::InvalidState) {
                        return false;
                }
        }
        return true;
}

std::vector<Body> build_title_banner(const Grid &grid)
{
        std::vector<Body> banner;
        for (const BannerLetter &letter : BANNER_LETTERS) {
                Body body =
                    Body::spawn(grid, letter.origin.x, letter.origin.y);
                if (!apply_banner_script(&body, letter.script)) {
                        LOG_WARN(TAG, "Skipping banner letter %c",
                                 letter.letter);
                        continue;
                }
                LOG_DEBUG(TAG, "Banner letter %c has %d segments",
                          letter.letter, body.length());
                banner.push_back(body);
        }
        return banner;
}

} // namespace SnakeDefinitions
