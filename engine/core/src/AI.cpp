#include "pong/core/AI.hpp"

namespace pong::core::ai {

int PursuitTarget(const Ball& ball) noexcept {
    return ball.body.rect.centerY();
}

void Pursue(Paddle& paddle, const Ball& ball, const Arena& arena) noexcept {
    MoveTo(paddle, PursuitTarget(ball));
    ClampToArena(paddle.body, arena);
}

}  // namespace pong::core::ai
