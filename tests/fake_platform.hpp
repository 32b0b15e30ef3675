#pragma once
#include "src/common/platform/interface/platform.hpp"
#include <deque>
#include <optional>
#include <string>
#include <vector>

typedef struct RecordedRectangle {
        Point start;
        int width;
        int height;
        Color color;
} RecordedRectangle;

typedef struct RecordedCircle {
        Point center;
        int radius;
        Color color;
} RecordedCircle;

typedef struct RecordedString {
        Point start;
        std::string text;
        Color fg_color;
} RecordedString;

/**
 * Display double recording every draw call. `refresh` starts failing after
 * `refreshes_before_close` successful calls (never if negative).
 */
class FakeDisplay : public Display
{
      public:
        void setup() override {}
        void clear(Color color) override
        {
                clears++;
                rectangles.clear();
                circles.clear();
                strings.clear();
        }
        void draw_circle(Point center, int radius, Color color,
                         int border_width, bool filled) override
        {
                circles.push_back({center, radius, color});
        }
        void draw_rectangle(Point start, int width, int height, Color color,
                            int border_width, bool filled) override
        {
                rectangles.push_back({start, width, height, color});
        }
        void draw_string(Point start, const char *string_buffer,
                         FontSize font_size, Color bg_color,
                         Color fg_color) override
        {
                strings.push_back({start, string_buffer, fg_color});
        }
        int get_height() override { return height; }
        int get_width() override { return width; }
        bool refresh() override
        {
                refreshes++;
                return refreshes_before_close < 0 ||
                       refreshes <= refreshes_before_close;
        }

        bool has_string(const std::string &text) const
        {
                for (const RecordedString &s : strings) {
                        if (s.text == text) {
                                return true;
                        }
                }
                return false;
        }

        int width = 432;
        int height = 336;
        int refreshes_before_close = -1;
        int refreshes = 0;
        int clears = 0;
        std::vector<RecordedRectangle> rectangles;
        std::vector<RecordedCircle> circles;
        std::vector<RecordedString> strings;
};

/**
 * Returns the scripted inputs one per poll, then reports no input.
 */
class ScriptedDirectionalController : public DirectionalController
{
      public:
        bool poll_for_input(Direction *input) override
        {
                if (script.empty()) {
                        return false;
                }
                std::optional<Direction> next = script.front();
                script.pop_front();
                if (!next) {
                        return false;
                }
                *input = next.value();
                return true;
        }
        void setup() override {}

        std::deque<std::optional<Direction>> script;
};

class ScriptedActionController : public ActionController
{
      public:
        bool poll_for_input(Action *input) override
        {
                if (script.empty()) {
                        return false;
                }
                std::optional<Action> next = script.front();
                script.pop_front();
                if (!next) {
                        return false;
                }
                *input = next.value();
                return true;
        }
        void setup() override {}

        std::deque<std::optional<Action>> script;
};

class NoDelay : public DelayProvider
{
      public:
        void delay_ms(int ms) override { total_ms += ms; }

        int total_ms = 0;
};
