#include <gtest/gtest.h>
#include <stdlib.h>

#include "fake_platform.hpp"
#include "src/games/snake.hpp"

using namespace SnakeDefinitions;

class SnakeLoopTest : public ::testing::Test
{
      protected:
        void SetUp() override { srand(2024); }

        Platform platform()
        {
                return {.display = &display,
                        .directional_controllers = &directional_controllers,
                        .action_controllers = &action_controllers,
                        .delay_provider = &delay};
        }

        FakeDisplay display;
        ScriptedDirectionalController directional;
        ScriptedActionController actions;
        NoDelay delay;
        std::vector<DirectionalController *> directional_controllers = {
            &directional};
        std::vector<ActionController *> action_controllers = {&actions};
};

TEST_F(SnakeLoopTest, CollectsDirectionAndActions)
{
        directional.script = {RIGHT};
        actions.script = {START};
        Platform p = platform();

        InputEvents events = collect_input_events(&p);
        ASSERT_TRUE(events.direction.has_value());
        EXPECT_EQ(events.direction.value(), RIGHT);
        EXPECT_TRUE(events.start);
        EXPECT_FALSE(events.to_menu);
        EXPECT_FALSE(events.quit);

        events = collect_input_events(&p);
        EXPECT_FALSE(events.direction.has_value());
        EXPECT_FALSE(events.start);
}

TEST_F(SnakeLoopTest, QuitFromAnyControllerWins)
{
        ScriptedActionController second;
        actions.script = {QUIT};
        second.script = {START};
        action_controllers.push_back(&second);
        Platform p = platform();

        InputEvents events = collect_input_events(&p);
        EXPECT_TRUE(events.quit);
}

TEST_F(SnakeLoopTest, QuitEndsTheLoop)
{
        actions.script = {std::nullopt, START, std::nullopt, QUIT};
        Platform p = platform();

        auto maybe_action = snake_loop(&p, DEFAULT_SNAKE_CONFIG);

        ASSERT_TRUE(maybe_action.has_value());
        EXPECT_EQ(maybe_action.value(), UserAction::Exit);
        EXPECT_EQ(display.refreshes, 3);
        EXPECT_EQ(delay.total_ms, 3 * DEFAULT_SNAKE_CONFIG.tick_delay_ms);
}

TEST_F(SnakeLoopTest, ClosingTheWindowEndsTheLoop)
{
        display.refreshes_before_close = 4;
        Platform p = platform();

        auto maybe_action = snake_loop(&p, DEFAULT_SNAKE_CONFIG);

        ASSERT_TRUE(maybe_action.has_value());
        EXPECT_EQ(maybe_action.value(), UserAction::CloseWindow);
        EXPECT_EQ(display.refreshes, 5);
}

TEST_F(SnakeLoopTest, MainMenuFrameIsRendered)
{
        display.refreshes_before_close = 0;
        Platform p = platform();

        snake_loop(&p, DEFAULT_SNAKE_CONFIG);

        EXPECT_EQ(display.clears, 1);
        EXPECT_TRUE(display.has_string("SPACE: Start Game"));
        EXPECT_TRUE(display.has_string("Calories: 0"));
}
