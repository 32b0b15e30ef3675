#include <gtest/gtest.h>

#include "src/common/constants.hpp"
#include "src/common/grid.hpp"

TEST(GridTest, WrapIsIdentityInsideTheBoard)
{
        Grid grid(27, 20);
        for (int x = 0; x < grid.width; x++) {
                for (int y = 0; y < grid.height; y++) {
                        Point p = {.x = x, .y = y};
                        EXPECT_EQ(grid.wrap(p), p);
                }
        }
}

TEST(GridTest, WrapMapsOutOfBoundsCoordinatesToOppositeEdge)
{
        Grid grid(27, 20);
        EXPECT_EQ(grid.wrap({-1, 5}), (Point{26, 5}));
        EXPECT_EQ(grid.wrap({27, 5}), (Point{0, 5}));
        EXPECT_EQ(grid.wrap({5, -1}), (Point{5, 19}));
        EXPECT_EQ(grid.wrap({5, 20}), (Point{5, 0}));
}

TEST(GridTest, WrapHandlesAxesIndependently)
{
        Grid grid(10, 8);
        EXPECT_EQ(grid.wrap({-1, -1}), (Point{9, 7}));
        EXPECT_EQ(grid.wrap({10, 8}), (Point{0, 0}));
        EXPECT_EQ(grid.wrap({-1, 8}), (Point{9, 0}));
}

TEST(GridTest, WrapOfTranslatedPointStaysOnBoard)
{
        Grid grid(4, 3);
        Direction directions[] = {UP, RIGHT, DOWN, LEFT};
        for (int x = 0; x < grid.width; x++) {
                for (int y = 0; y < grid.height; y++) {
                        for (Direction d : directions) {
                                Point p = grid.wrap(translate_pure({x, y}, d));
                                EXPECT_TRUE(grid.contains(p));
                        }
                }
        }
}

TEST(GridTest, ContainsAndCellCount)
{
        Grid grid(3, 2);
        EXPECT_EQ(grid.cell_count(), 6);
        EXPECT_TRUE(grid.contains({2, 1}));
        EXPECT_FALSE(grid.contains({3, 1}));
        EXPECT_FALSE(grid.contains({0, -1}));
}

TEST(GridTest, GridToPixelAccountsForScoreBar)
{
        EXPECT_EQ(grid_to_pixel({0, 0}), (Point{0, SCORE_BAR_HEIGHT}));
        EXPECT_EQ(grid_to_pixel({2, 3}),
                  (Point{2 * TILE_SIZE, 3 * TILE_SIZE + SCORE_BAR_HEIGHT}));
}

TEST(DirectionTest, PerpendicularAndOpposite)
{
        EXPECT_TRUE(is_perpendicular(UP, LEFT));
        EXPECT_TRUE(is_perpendicular(RIGHT, DOWN));
        EXPECT_FALSE(is_perpendicular(UP, UP));
        EXPECT_FALSE(is_perpendicular(UP, DOWN));
        EXPECT_TRUE(is_opposite(LEFT, RIGHT));
        EXPECT_EQ(get_opposite(DOWN), UP);
}
