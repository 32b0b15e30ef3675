#include "point.hpp"

Point translate_pure(const Point &p, Direction dir)
{
        switch (dir) {
        case Direction::UP:
                return {p.x, p.y - 1};
        case Direction::DOWN:
                return {p.x, p.y + 1};
        case Direction::LEFT:
                return {p.x - 1, p.y};
        case Direction::RIGHT:
                return {p.x + 1, p.y};
        default:
                // No translation for unknown direction
                return p;
        }
}
