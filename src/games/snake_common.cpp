#include "snake_common.hpp"
#include "../common/logging.hpp"
#include <stdlib.h>

#define TAG "snake_common"

namespace SnakeDefinitions
{
const char *tile_type_to_str(TileType type)
{
        switch (type) {
        case TileType::Head:
                return "Head";
        case TileType::Body:
                return "Body";
        case TileType::Bend:
                return "Bend";
        case TileType::Tail:
                return "Tail";
        default:
                return "Unknown";
        }
}

RenderTile head_tile(Direction direction)
{
        switch (direction) {
        case UP:
                return HEAD_UP;
        case RIGHT:
                return HEAD_RIGHT;
        case DOWN:
                return HEAD_DOWN;
        case LEFT:
                return HEAD_LEFT;
        }
        return HEAD_UP;
}

RenderTile derive_retired_head_tile(Direction old_facing,
                                    Direction new_direction)
{
        switch (new_direction) {
        case UP:
                switch (old_facing) {
                case LEFT:
                        return BEND_RIGHT_UP;
                case RIGHT:
                        return BEND_LEFT_UP;
                default:
                        return BODY_UP;
                }
        case DOWN:
                switch (old_facing) {
                case LEFT:
                        return BEND_RIGHT_DOWN;
                case RIGHT:
                        return BEND_LEFT_DOWN;
                default:
                        return BODY_DOWN;
                }
        case LEFT:
                switch (old_facing) {
                case UP:
                        return BEND_LEFT_DOWN;
                case DOWN:
                        return BEND_LEFT_UP;
                default:
                        return BODY_LEFT;
                }
        case RIGHT:
                switch (old_facing) {
                case UP:
                        return BEND_RIGHT_DOWN;
                case DOWN:
                        return BEND_RIGHT_UP;
                default:
                        return BODY_RIGHT;
                }
        }
        return BODY_UP;
}

std::optional<RenderTile> tail_tile_towards(const Point &previous,
                                            const Point &tail)
{
        int dx = abs(previous.x - tail.x);
        int dy = abs(previous.y - tail.y);

        if (previous.x < tail.x) {
                return dx == 1 ? TAIL_LEFT : TAIL_RIGHT;
        }
        if (previous.x > tail.x) {
                return dx == 1 ? TAIL_RIGHT : TAIL_LEFT;
        }
        if (previous.y < tail.y) {
                return dy == 1 ? TAIL_UP : TAIL_DOWN;
        }
        if (previous.y > tail.y) {
                return dy == 1 ? TAIL_DOWN : TAIL_UP;
        }
        return std::nullopt;
}

Body Body::spawn(const Grid &grid, int origin_x, int origin_y)
{
        Body body(grid);
        Point head = grid.wrap({.x = origin_x, .y = origin_y});
        Point middle = grid.wrap({.x = origin_x, .y = origin_y + 1});
        Point tail = grid.wrap({.x = origin_x, .y = origin_y + 2});

        body.chain.push_back({.position = head,
                              .facing = UP,
                              .tile = HEAD_UP,
                              .is_skeleton = false});
        body.chain.push_back({.position = middle,
                              .facing = UP,
                              .tile = BODY_UP,
                              .is_skeleton = false});
        body.chain.push_back({.position = tail,
                              .facing = UP,
                              .tile = TAIL_UP,
                              .is_skeleton = false});

        LOG_DEBUG(TAG, "Spawned snake with head at {x: %d, y: %d}", head.x,
                  head.y);
        return body;
}

Point Body::next_head_position(Direction direction) const
{
        return grid.wrap(translate_pure(head().position, direction));
}

void Body::advance(Direction direction)
{
        Segment &previous_head = chain.front();
        previous_head.tile =
            derive_retired_head_tile(previous_head.facing, direction);

        Point position = next_head_position(direction);
        chain.push_front({.position = position,
                          .facing = direction,
                          .tile = head_tile(direction),
                          .is_skeleton = false});

        LOG_TRACE(TAG, "Advanced %s to {x: %d, y: %d}, length: %d",
                  direction_to_str(direction), position.x, position.y,
                  length());
}

std::optional<BodyError> Body::remove_tail()
{
        if (chain.size() <= 1) {
                LOG_ERROR(TAG,
                          "Refusing to remove the tail of a body of length %d",
                          length());
                return BodyError::InvalidState;
        }
        chain.pop_back();

        if (chain.size() < 2) {
                // The head is the only segment left, it keeps its own tile.
                return std::nullopt;
        }

        Segment &tail = chain.back();
        const Segment &previous = chain[chain.size() - 2];
        auto maybe_tile = tail_tile_towards(previous.position, tail.position);
        if (maybe_tile) {
                tail.tile = maybe_tile.value();
        }
        return std::nullopt;
}

bool Body::check_food_eaten(const Point &food) const
{
        return head().position == food;
}

bool Body::check_self_collision(Direction direction) const
{
        Point next = next_head_position(direction);
        // The current head is skipped, it is going to move out of its cell.
        for (auto it = chain.begin() + 1; it != chain.end(); it++) {
                if (it->position == next) {
                        return true;
                }
        }
        return false;
}

bool Body::occupies(const Point &p) const
{
        for (const Segment &segment : chain) {
                if (segment.position == p) {
                        return true;
                }
        }
        return false;
}

bool Body::mark_next_skeleton()
{
        for (Segment &segment : chain) {
                if (!segment.is_skeleton) {
                        segment.is_skeleton = true;
                        return true;
                }
        }
        return false;
}

bool Body::all_skeleton() const
{
        for (const Segment &segment : chain) {
                if (!segment.is_skeleton) {
                        return false;
                }
        }
        return true;
}

} // namespace SnakeDefinitions
