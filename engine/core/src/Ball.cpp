#include "pong/core/Ball.hpp"

namespace pong::core {

namespace {

// The player defends the left edge and returns the ball rightwards; the
// computer defends the right edge and returns it leftwards.
bool HeadingInto(const Body& ball, Side side) noexcept {
    switch (side) {
        case Side::Player:
            return ball.velocity.x < 0;
        case Side::Computer:
            return ball.velocity.x > 0;
    }
    return false;
}

}  // namespace

Ball MakeBall(int size, const Vec2& start, const Vec2& velocity, Color color) {
    Ball ball{Body{Rect{start.x, start.y, size, size}, velocity, color}, start};
    return ball;
}

void ResetBall(Ball& ball, ServeFlip flip) noexcept {
    ball.body.rect.setPosition(ball.start);
    switch (flip) {
        case ServeFlip::Vertical:
            BounceY(ball.body);
            break;
        case ServeFlip::Horizontal:
            BounceX(ball.body);
            break;
    }
}

CollisionReport CollideBall(Ball& ball,
                            const Arena& arena,
                            std::initializer_list<const Paddle*> paddles) noexcept {
    CollisionReport report;
    const Rect& rect = ball.body.rect;

    if (rect.left() <= 0 || rect.right() >= arena.width()) {
        BounceX(ball.body);
        report.wall_x = true;
    }

    if (rect.top() <= 0 || rect.bottom() >= arena.height()) {
        BounceY(ball.body);
        report.wall_y = true;
    }

    for (const Paddle* paddle : paddles) {
        if (paddle == nullptr || !Overlaps(ball.body, paddle->body)) {
            continue;
        }
        report.paddle_contact = true;
        if (HeadingInto(ball.body, paddle->side)) {
            BounceX(ball.body);
            ++report.paddle_hits;
        }
    }
    return report;
}

}  // namespace pong::core
