#pragma once

#include <initializer_list>

#include "pong/core/Arena.hpp"
#include "pong/core/Body.hpp"
#include "pong/core/Paddle.hpp"

namespace pong::core {

// Which velocity component is negated when the ball is served again.
enum class ServeFlip { Vertical, Horizontal };

struct Ball {
    Body body;
    Vec2 start{};
};

Ball MakeBall(int size, const Vec2& start, const Vec2& velocity, Color color);

void ResetBall(Ball& ball, ServeFlip flip) noexcept;

struct CollisionReport {
    bool wall_x = false;
    bool wall_y = false;
    int paddle_hits = 0;
    bool paddle_contact = false;

    bool defended() const noexcept { return paddle_contact; }
};

// Wall checks use inclusive bounds, so a ball sitting on a wall keeps
// reflecting until it has moved off it. A paddle only reflects a ball moving
// towards the edge it defends, so a wall bounce in the same tick is never
// undone. An overlapping ball already moving away still counts as contact.
CollisionReport CollideBall(Ball& ball,
                            const Arena& arena,
                            std::initializer_list<const Paddle*> paddles) noexcept;

}  // namespace pong::core
