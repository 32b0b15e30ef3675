#include "render_projection.hpp"

#define CALORIES_PER_CUPCAKE 200

namespace SnakeDefinitions
{
std::vector<SegmentSprite> project_body(const Body &body, bool tongue_out)
{
        std::vector<SegmentSprite> sprites;
        sprites.reserve(body.length());

        bool is_head = true;
        for (const Segment &segment : body.segments()) {
                sprites.push_back(
                    {.cell = segment.position,
                     .type = segment.tile.type,
                     .rotation = segment.tile.rotation,
                     .is_skeleton = segment.is_skeleton,
                     .has_tongue_out =
                         is_head && tongue_out && !segment.is_skeleton});
                is_head = false;
        }
        return sprites;
}

FrameProjection project_frame(const SessionState &session,
                              const std::vector<Body> &banner)
{
        FrameProjection frame = {
            .phase = session.phase,
            .snake = project_body(session.body, session.tongue_out),
            .food = session.food.position,
            .show_food = session.phase != Phase::MainMenu,
            .dimmed = session.phase == Phase::GameOver,
            .score = session.score,
            .countdown_value = session.countdown_value,
            .banner = {},
        };

        if (session.phase == Phase::MainMenu) {
                for (const Body &letter : banner) {
                        frame.banner.push_back(project_body(letter, false));
                }
        }
        return frame;
}

int calories_for_score(int score) { return score * CALORIES_PER_CUPCAKE; }

int rotation_to_degrees(Rotation rotation)
{
        switch (rotation) {
        case Rotation::Deg0:
                return 0;
        case Rotation::Deg90:
                return 90;
        case Rotation::Deg180:
                return 180;
        case Rotation::Deg270:
                return 270;
        }
        return 0;
}

} // namespace SnakeDefinitions
