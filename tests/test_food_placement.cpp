#include <gtest/gtest.h>
#include <stdlib.h>

#include "src/games/food_placement.hpp"

using namespace SnakeDefinitions;

TEST(FoodPlacementTest, FoodIsNeverPlacedOnTheSnake)
{
        srand(7);
        Grid grid(27, 20);
        Body body = Body::spawn(grid, 13, 10);
        for (int i = 0; i < 40; i++) {
                body.advance(i % 10 < 5 ? LEFT : UP);
        }

        for (int i = 0; i < 200; i++) {
                auto maybe_food = place_food(grid, body);
                ASSERT_TRUE(maybe_food.has_value());
                EXPECT_TRUE(grid.contains(maybe_food->position));
                EXPECT_FALSE(body.occupies(maybe_food->position));
        }
}

TEST(FoodPlacementTest, NearlyFullBoardFindsTheLastFreeCell)
{
        srand(3);
        Grid grid(2, 3);
        Body body = Body::spawn(grid, 0, 0);
        body.advance(RIGHT);
        body.advance(DOWN);
        // (0, 0), (0, 1), (0, 2), (1, 0) and (1, 1) are taken.

        for (int i = 0; i < 20; i++) {
                auto maybe_food = place_food(grid, body);
                ASSERT_TRUE(maybe_food.has_value());
                EXPECT_EQ(maybe_food->position, (Point{1, 2}));
        }
}

TEST(FoodPlacementTest, FullBoardHasNoRoomForFood)
{
        Grid grid(2, 3);
        Body body = Body::spawn(grid, 0, 0);
        body.advance(RIGHT);
        body.advance(DOWN);
        body.advance(DOWN);

        EXPECT_FALSE(place_food(grid, body).has_value());
}
