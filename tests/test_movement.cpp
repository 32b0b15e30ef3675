#include <gtest/gtest.h>
#include <stdlib.h>

#include "src/games/movement.hpp"

using namespace SnakeDefinitions;

class MovementTest : public ::testing::Test
{
      protected:
        void SetUp() override { srand(11); }

        Grid grid{27, 20};
        Body body = Body::spawn(grid, 5, 5);
        Food food = {.position = {.x = 20, .y = 15}};
        int score = 0;
};

TEST_F(MovementTest, StepWithoutGrowthKeepsLength)
{
        StepResult result =
            take_snake_step(grid, &body, &food, &score, UP, true, true);

        EXPECT_EQ(result, StepResult::Moved);
        EXPECT_EQ(body.length(), 3);
        EXPECT_EQ(body.head().position, (Point{5, 4}));
        EXPECT_EQ(body.tail().position, (Point{5, 6}));
}

TEST_F(MovementTest, StepWithPendingGrowthGrowsOnceAndClearsFlag)
{
        body.set_pending_growth(true);

        take_snake_step(grid, &body, &food, &score, UP, true, true);
        EXPECT_EQ(body.length(), 4);
        EXPECT_FALSE(body.has_pending_growth());

        take_snake_step(grid, &body, &food, &score, UP, true, true);
        EXPECT_EQ(body.length(), 4);
}

TEST_F(MovementTest, EatingFoodScoresAndSchedulesGrowth)
{
        food.position = {.x = 6, .y = 5};

        StepResult result =
            take_snake_step(grid, &body, &food, &score, RIGHT, true, true);

        EXPECT_EQ(result, StepResult::AteFood);
        EXPECT_EQ(score, 1);
        EXPECT_TRUE(body.has_pending_growth());
        EXPECT_EQ(body.head().position, (Point{6, 5}));
        EXPECT_FALSE(body.occupies(food.position));
        EXPECT_TRUE(grid.contains(food.position));
}

TEST_F(MovementTest, FoodIsIgnoredWhenNotChecked)
{
        food.position = {.x = 6, .y = 5};

        StepResult result =
            take_snake_step(grid, &body, &food, &score, RIGHT, true, false);

        EXPECT_EQ(result, StepResult::Moved);
        EXPECT_EQ(score, 0);
        EXPECT_FALSE(body.has_pending_growth());
        EXPECT_EQ(food.position, (Point{6, 5}));
}

TEST_F(MovementTest, CollisionLeavesBodyUntouched)
{
        StepResult result =
            take_snake_step(grid, &body, &food, &score, DOWN, true, true);

        EXPECT_EQ(result, StepResult::Collision);
        EXPECT_EQ(body.length(), 3);
        EXPECT_EQ(body.head().position, (Point{5, 5}));
}

TEST_F(MovementTest, CollisionIsIgnoredWhenDeathIsNotChecked)
{
        StepResult result =
            take_snake_step(grid, &body, &food, &score, DOWN, false, false);

        EXPECT_EQ(result, StepResult::Moved);
        EXPECT_EQ(body.head().position, (Point{5, 6}));
}

TEST_F(MovementTest, MovingSingleSegmentBodyIsInvalid)
{
        ASSERT_FALSE(body.remove_tail().has_value());
        ASSERT_FALSE(body.remove_tail().has_value());

        EXPECT_EQ(move_body(&body, UP), StepResult::InvalidState);
        EXPECT_EQ(body.length(), 1);
}

TEST(DirectionChangeTest, OnlyPerpendicularRequestsAreAccepted)
{
        EXPECT_FALSE(is_valid_direction_change(UP, UP));
        EXPECT_FALSE(is_valid_direction_change(UP, DOWN));
        EXPECT_TRUE(is_valid_direction_change(UP, LEFT));
        EXPECT_TRUE(is_valid_direction_change(UP, RIGHT));
        EXPECT_TRUE(is_valid_direction_change(LEFT, DOWN));
        EXPECT_FALSE(is_valid_direction_change(LEFT, RIGHT));
}

TEST(SpeedLawTest, TicksPerMoveDropWithScoreDownToFloor)
{
        EXPECT_EQ(ticks_per_move_for_score(0), 40);
        EXPECT_EQ(ticks_per_move_for_score(1), 39);
        EXPECT_EQ(ticks_per_move_for_score(33), 7);
        EXPECT_EQ(ticks_per_move_for_score(34), 7);
        EXPECT_EQ(ticks_per_move_for_score(100), 7);
}

TEST(RandomDirectionTest, NeverReverses)
{
        srand(5);
        Direction directions[] = {UP, RIGHT, DOWN, LEFT};
        for (Direction current : directions) {
                bool kept_straight = false;
                bool turned = false;
                for (int i = 0; i < 200; i++) {
                        Direction next = random_snake_direction(current);
                        EXPECT_FALSE(is_opposite(current, next));
                        kept_straight |= next == current;
                        turned |= is_perpendicular(current, next);
                }
                EXPECT_TRUE(kept_straight);
                EXPECT_TRUE(turned);
        }
}
