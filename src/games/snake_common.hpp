#pragma once
#include "../common/grid.hpp"
#include <cstdint>
#include <deque>
#include <optional>

namespace SnakeDefinitions
{
/**
 * Kind of sprite used to render a single segment of the snake.
 */
enum class TileType : uint8_t {
        Head,
        Body,
        // Segment where the snake turned by 90 degrees.
        Bend,
        Tail,
};

/**
 * Clockwise rotation that needs to be applied to a tile sprite drawn in its
 * default orientation. Heads, bodies and tails are drawn pointing up by
 * default, bends connect the left and bottom edges of the tile by default.
 */
enum class Rotation : uint8_t {
        Deg0,
        Deg90,
        Deg180,
        Deg270,
};

typedef struct RenderTile {
        TileType type;
        Rotation rotation;
} RenderTile;

inline bool operator==(const RenderTile &t1, const RenderTile &t2)
{
        return t1.type == t2.type && t1.rotation == t2.rotation;
}

constexpr RenderTile HEAD_UP = {TileType::Head, Rotation::Deg0};
constexpr RenderTile HEAD_RIGHT = {TileType::Head, Rotation::Deg90};
constexpr RenderTile HEAD_DOWN = {TileType::Head, Rotation::Deg180};
constexpr RenderTile HEAD_LEFT = {TileType::Head, Rotation::Deg270};

constexpr RenderTile BODY_UP = {TileType::Body, Rotation::Deg0};
constexpr RenderTile BODY_RIGHT = {TileType::Body, Rotation::Deg90};
constexpr RenderTile BODY_DOWN = {TileType::Body, Rotation::Deg180};
constexpr RenderTile BODY_LEFT = {TileType::Body, Rotation::Deg270};

// Bends are named after the two tile edges that they connect.
constexpr RenderTile BEND_LEFT_DOWN = {TileType::Bend, Rotation::Deg0};
constexpr RenderTile BEND_LEFT_UP = {TileType::Bend, Rotation::Deg90};
constexpr RenderTile BEND_RIGHT_UP = {TileType::Bend, Rotation::Deg180};
constexpr RenderTile BEND_RIGHT_DOWN = {TileType::Bend, Rotation::Deg270};

// Tails point towards the segment in front of them.
constexpr RenderTile TAIL_UP = {TileType::Tail, Rotation::Deg0};
constexpr RenderTile TAIL_RIGHT = {TileType::Tail, Rotation::Deg90};
constexpr RenderTile TAIL_DOWN = {TileType::Tail, Rotation::Deg180};
constexpr RenderTile TAIL_LEFT = {TileType::Tail, Rotation::Deg270};

const char *tile_type_to_str(TileType type);

RenderTile head_tile(Direction direction);

/**
 * Returns the tile that the current head segment turns into once a new head
 * is pushed in front of it. The segment was facing `old_facing` and the snake
 * now moves along `new_direction`: equal directions give a straight body
 * tile, perpendicular ones give the bend joining the edge the snake came from
 * with the edge it leaves through. A reversal cannot be requested by the
 * player, it falls back to the straight tile along `new_direction`.
 */
RenderTile derive_retired_head_tile(Direction old_facing,
                                    Direction new_direction);

/**
 * Computes the orientation of the tail after the last segment was removed.
 * `previous` is the segment directly in front of the `tail`. A displacement
 * of exactly one cell gives a tail pointing at `previous`. Any other
 * displacement along the axis means that the body wraps around the board
 * between the two segments and the tail points the opposite way.
 *
 * Returns `std::nullopt` if both segments share the same cell, in which case
 * the orientation cannot be inferred.
 */
std::optional<RenderTile> tail_tile_towards(const Point &previous,
                                            const Point &tail);

typedef struct Segment {
        Point position;
        Direction facing;
        RenderTile tile;
        bool is_skeleton;
} Segment;

enum class BodyError {
        // The operation would break the body invariants (e.g. removing the
        // tail of a single-segment body).
        InvalidState,
};

/**
 * The snake. Segments are stored head-first: index 0 is the head and the last
 * element is the tail. Every segment is owned by the body.
 */
class Body
{
      public:
        /**
         * Creates a new snake with three segments stacked vertically starting
         * at the origin: head at (x, y), then (x, y + 1) and the tail at
         * (x, y + 2). All segments are facing up.
         */
        static Body spawn(const Grid &grid, int origin_x, int origin_y);

        /**
         * Pushes a new head segment one cell away from the current head along
         * `direction` (wrapping around the board edges). The previous head is
         * re-tiled as a body or bend segment.
         */
        void advance(Direction direction);

        /**
         * Drops the last segment and re-orients the new tail. Bodies of
         * length one or less are left untouched and
         * `BodyError::InvalidState` is returned.
         */
        std::optional<BodyError> remove_tail();

        bool check_food_eaten(const Point &food) const;

        /**
         * Checks if moving the head along `direction` would land it on one of
         * the other segments. The check is performed against the body before
         * the move, so the cell of the current tail counts as occupied even
         * though the tail would be removed during the same move.
         */
        bool check_self_collision(Direction direction) const;

        /**
         * Cell that the head would occupy after moving along `direction`.
         */
        Point next_head_position(Direction direction) const;

        bool occupies(const Point &p) const;

        /**
         * Turns the first non-skeletal segment (searching from the head) into
         * a skeleton. Returns false if all segments were skeletal already.
         */
        bool mark_next_skeleton();
        bool all_skeleton() const;

        const Segment &head() const { return chain.front(); }
        const Segment &tail() const { return chain.back(); }
        const std::deque<Segment> &segments() const { return chain; }
        int length() const { return static_cast<int>(chain.size()); }

        bool has_pending_growth() const { return pending_growth; }
        void set_pending_growth(bool value) { pending_growth = value; }

      private:
        Body(const Grid &grid) : grid(grid), pending_growth(false) {}

        Grid grid;
        std::deque<Segment> chain;
        /**
         * One-shot flag set after eating. The next move keeps the tail in
         * place and clears the flag.
         */
        bool pending_growth;
};

} // namespace SnakeDefinitions
