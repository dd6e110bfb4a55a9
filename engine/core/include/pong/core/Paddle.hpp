#pragma once

#include "pong/core/Body.hpp"

namespace pong::core {

enum class Side { Player, Computer };

const char* SideName(Side side) noexcept;

struct Paddle {
    Body body;
    int max_speed = 0;
    Side side = Side::Player;
};

Paddle MakePaddle(const Rect& rect, int max_speed, Side side, Color color);

// Top edge the paddle reaches this tick when heading for target_y, moving at
// most max_speed.
int StepToward(const Paddle& paddle, int target_y) noexcept;

void MoveTo(Paddle& paddle, int target_y) noexcept;

}  // namespace pong::core
