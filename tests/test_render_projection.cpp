#include <gtest/gtest.h>
#include <stdlib.h>

#include "src/games/render_projection.hpp"
#include "src/games/title_banner.hpp"

using namespace SnakeDefinitions;

class RenderProjectionTest : public ::testing::Test
{
      protected:
        void SetUp() override
        {
                srand(99);
                change_phase(&session, Phase::Countdown);
        }

        SessionState session = create_session(DEFAULT_SNAKE_CONFIG);
        std::vector<Body> banner = build_title_banner(session.grid);
};

TEST_F(RenderProjectionTest, SegmentsAreProjectedHeadToTail)
{
        session.body.advance(RIGHT);
        std::vector<SegmentSprite> sprites = project_body(session.body, false);

        ASSERT_EQ(sprites.size(), 4u);
        EXPECT_EQ(sprites[0].cell, (Point{14, 10}));
        EXPECT_EQ(sprites[0].type, TileType::Head);
        EXPECT_EQ(sprites[0].rotation, Rotation::Deg90);
        EXPECT_EQ(sprites[1].type, TileType::Bend);
        EXPECT_EQ(sprites[1].rotation, Rotation::Deg270);
        EXPECT_EQ(sprites[2].type, TileType::Body);
        EXPECT_EQ(sprites[3].type, TileType::Tail);
        EXPECT_EQ(sprites[3].rotation, Rotation::Deg0);
}

TEST_F(RenderProjectionTest, TongueIsShownOnLivingHeadOnly)
{
        std::vector<SegmentSprite> sprites = project_body(session.body, true);
        EXPECT_TRUE(sprites[0].has_tongue_out);
        EXPECT_FALSE(sprites[1].has_tongue_out);

        session.body.mark_next_skeleton();
        sprites = project_body(session.body, true);
        EXPECT_TRUE(sprites[0].is_skeleton);
        EXPECT_FALSE(sprites[0].has_tongue_out);
}

TEST_F(RenderProjectionTest, DimmedOnlyInGameOver)
{
        Phase phases[] = {Phase::MainMenu, Phase::Countdown, Phase::Playing,
                          Phase::Dying};
        for (Phase phase : phases) {
                session.phase = phase;
                EXPECT_FALSE(project_frame(session, banner).dimmed);
        }

        session.phase = Phase::GameOver;
        EXPECT_TRUE(project_frame(session, banner).dimmed);
}

TEST_F(RenderProjectionTest, BannerIsOnlyProjectedInMainMenu)
{
        FrameProjection frame = project_frame(session, banner);
        EXPECT_TRUE(frame.banner.empty());
        EXPECT_TRUE(frame.show_food);
        EXPECT_EQ(frame.food, session.food.position);

        session.phase = Phase::MainMenu;
        frame = project_frame(session, banner);
        EXPECT_EQ(frame.banner.size(), 5u);
        EXPECT_FALSE(frame.show_food);
}

TEST_F(RenderProjectionTest, HudValues)
{
        session.score = 7;
        session.countdown_value = 2;
        FrameProjection frame = project_frame(session, banner);

        EXPECT_EQ(frame.score, 7);
        EXPECT_EQ(frame.countdown_value, 2);
        EXPECT_EQ(calories_for_score(frame.score), 1400);
        EXPECT_EQ(calories_for_score(0), 0);
}

TEST(RotationTest, DegreesAreClockwise)
{
        EXPECT_EQ(rotation_to_degrees(Rotation::Deg0), 0);
        EXPECT_EQ(rotation_to_degrees(Rotation::Deg90), 90);
        EXPECT_EQ(rotation_to_degrees(Rotation::Deg180), 180);
        EXPECT_EQ(rotation_to_degrees(Rotation::Deg270), 270);
        EXPECT_EQ(rotation_to_degrees(HEAD_LEFT.rotation), 270);
}
