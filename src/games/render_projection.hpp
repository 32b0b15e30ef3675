#pragma once
#include "session.hpp"
#include <vector>

namespace SnakeDefinitions
{
/**
 * Everything the renderer needs to know about a single snake segment.
 */
typedef struct SegmentSprite {
        Point cell;
        TileType type;
        Rotation rotation;
        bool is_skeleton;
        bool has_tongue_out;
} SegmentSprite;

/**
 * Read-only snapshot of the session taken once per displayed frame.
 */
typedef struct FrameProjection {
        Phase phase;
        // Head-to-tail order.
        std::vector<SegmentSprite> snake;
        Point food;
        bool show_food;
        // Set only in the game over phase.
        bool dimmed;
        int score;
        int countdown_value;
        // Letters of the title banner, only populated in the main menu.
        std::vector<std::vector<SegmentSprite>> banner;
} FrameProjection;

/**
 * Projects the segments of a body in head-to-tail order. The head gets its
 * tongue out only if `tongue_out` is set and the head is not a skeleton.
 */
std::vector<SegmentSprite> project_body(const Body &body, bool tongue_out);

FrameProjection project_frame(const SessionState &session,
                              const std::vector<Body> &banner);

int calories_for_score(int score);

int rotation_to_degrees(Rotation rotation);

} // namespace SnakeDefinitions
