#include "pong/core/Paddle.hpp"

#include <stdexcept>

namespace pong::core {

const char* SideName(Side side) noexcept {
    switch (side) {
        case Side::Player:
            return "Player";
        case Side::Computer:
            return "Computer";
    }
    return "Unknown";
}

Paddle MakePaddle(const Rect& rect, int max_speed, Side side, Color color) {
    if (max_speed < 0) {
        throw std::invalid_argument("Paddle max_speed must not be negative");
    }
    Paddle paddle{Body{rect, Vec2{}, color}, max_speed, side};
    return paddle;
}

int StepToward(const Paddle& paddle, int target_y) noexcept {
    const int current = paddle.body.rect.top();
    int delta = target_y - current;
    if (delta > paddle.max_speed) {
        delta = paddle.max_speed;
    } else if (delta < -paddle.max_speed) {
        delta = -paddle.max_speed;
    }
    return current + delta;
}

void MoveTo(Paddle& paddle, int target_y) noexcept {
    paddle.body.rect.setTop(StepToward(paddle, target_y));
}

}  // namespace pong::core
