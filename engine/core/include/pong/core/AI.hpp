#pragma once

#include "pong/core/Arena.hpp"
#include "pong/core/Ball.hpp"
#include "pong/core/Paddle.hpp"

namespace pong::core::ai {

// Coordinate the computer paddle chases: the ball's current center, with no
// look-ahead on its velocity.
int PursuitTarget(const Ball& ball) noexcept;

void Pursue(Paddle& paddle, const Ball& ball, const Arena& arena) noexcept;

}  // namespace pong::core::ai
