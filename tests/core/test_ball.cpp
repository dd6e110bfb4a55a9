#include <cassert>
#include <cstdlib>
#include <iostream>

#include "pong/core/Arena.hpp"
#include "pong/core/Ball.hpp"
#include "pong/core/Paddle.hpp"

using namespace pong::core;

namespace {

Ball MakeTestBall(int x, int y, int vx, int vy) {
    Ball ball = MakeBall(20, Vec2{400, 250}, Vec2{vx, vy}, Color{});
    ball.body.rect.setPosition(Vec2{x, y});
    return ball;
}

void TestAdvanceAddsVelocity() {
    Ball ball = MakeBall(20, Vec2{400, 250}, Vec2{5, 5}, Color{});
    Advance(ball.body);
    assert(ball.body.rect.x() == 405);
    assert(ball.body.rect.y() == 255);
    Advance(ball.body);
    assert(ball.body.rect.position() == (Vec2{410, 260}));
}

void TestBouncePairsCancel() {
    Ball ball = MakeBall(20, Vec2{400, 250}, Vec2{5, -3}, Color{});
    BounceX(ball.body);
    assert(ball.body.velocity == (Vec2{-5, -3}));
    BounceX(ball.body);
    assert(ball.body.velocity == (Vec2{5, -3}));
    BounceY(ball.body);
    BounceY(ball.body);
    assert(ball.body.velocity == (Vec2{5, -3}));
}

void TestLeftAndRightWallsReflect() {
    Arena arena(800, 500);

    Ball left = MakeTestBall(-3, 200, -5, 5);
    auto report = CollideBall(left, arena, {});
    assert(report.wall_x);
    assert(!report.wall_y);
    assert(left.body.velocity.x == 5);

    Ball right = MakeTestBall(780, 200, 5, 5);
    report = CollideBall(right, arena, {});
    assert(report.wall_x);
    assert(right.body.velocity.x == -5);

    Ball inside = MakeTestBall(779, 200, 5, 5);
    report = CollideBall(inside, arena, {});
    assert(!report.wall_x);
    assert(inside.body.velocity.x == 5);
}

void TestTopAndBottomWallsReflect() {
    Arena arena(800, 500);

    Ball top = MakeTestBall(300, 0, 5, -5);
    auto report = CollideBall(top, arena, {});
    assert(report.wall_y);
    assert(top.body.velocity.y == 5);

    Ball bottom = MakeTestBall(300, 480, 5, 5);
    report = CollideBall(bottom, arena, {});
    assert(report.wall_y);
    assert(bottom.body.velocity.y == -5);
}

void TestBoundaryIsInclusiveAndPurelyReflective() {
    Arena arena(800, 500);
    Ball ball = MakeTestBall(0, 200, -5, 0);

    CollideBall(ball, arena, {});
    assert(ball.body.velocity.x == 5);
    // Still on the boundary: the next check reflects again.
    CollideBall(ball, arena, {});
    assert(ball.body.velocity.x == -5);
    // No position change from the collision rule itself.
    assert(ball.body.rect.x() == 0);
}

void TestPaddleReflectsApproachingBall() {
    Arena arena(800, 500);
    Paddle paddle = MakePaddle(Rect{0, 240, 10, 80}, 10, Side::Player, Color{});

    Ball ball = MakeTestBall(5, 250, -5, 5);
    auto report = CollideBall(ball, arena, {&paddle});
    assert(report.paddle_hits == 1);
    assert(report.defended());
    assert(ball.body.velocity.x == 5);

    Paddle right = MakePaddle(Rect{780, 240, 10, 80}, 10, Side::Computer, Color{});
    Ball incoming = MakeTestBall(765, 250, 5, -5);
    report = CollideBall(incoming, arena, {&paddle, &right});
    assert(report.paddle_hits == 1);
    assert(incoming.body.velocity.x == -5);
    assert(incoming.body.velocity.y == -5);
}

void TestTouchingEdgeIsNotACollision() {
    Arena arena(800, 500);
    Paddle paddle = MakePaddle(Rect{0, 240, 10, 80}, 10, Side::Player, Color{});
    Ball ball = MakeTestBall(10, 250, -5, 5);
    auto report = CollideBall(ball, arena, {&paddle});
    assert(!report.defended());
    assert(ball.body.velocity.x == -5);
}

void TestBallAtWallInsidePaddleIsNotTrapped() {
    Arena arena(800, 500);
    Paddle paddle = MakePaddle(Rect{0, 240, 10, 80}, 10, Side::Player, Color{});
    Ball ball = MakeTestBall(0, 250, -5, 0);

    auto report = CollideBall(ball, arena, {&paddle});
    assert(report.wall_x);
    assert(report.paddle_contact);
    assert(report.paddle_hits == 0);
    assert(ball.body.velocity.x == 5);

    Advance(ball.body);
    report = CollideBall(ball, arena, {&paddle});
    assert(report.paddle_contact);
    assert(ball.body.velocity.x == 5);
}

void TestWallBounceBehindComputerPaddleHolds() {
    Arena arena(800, 500);
    Paddle paddle = MakePaddle(Rect{780, 240, 10, 80}, 10, Side::Computer, Color{});
    Ball ball = MakeTestBall(780, 250, 5, 5);

    auto report = CollideBall(ball, arena, {&paddle});
    assert(report.wall_x);
    assert(report.paddle_contact);
    assert(report.paddle_hits == 0);
    assert(ball.body.velocity.x == -5);

    Advance(ball.body);
    report = CollideBall(ball, arena, {&paddle});
    assert(!report.wall_x);
    assert(report.paddle_contact);
    assert(ball.body.velocity.x == -5);
}

void TestFastBallPastPlayerPaddleCenterHolds() {
    Arena arena(800, 500);
    Paddle paddle = MakePaddle(Rect{0, 240, 10, 80}, 10, Side::Player, Color{});
    Ball ball = MakeTestBall(-9, 250, -10, 0);

    auto report = CollideBall(ball, arena, {&paddle});
    assert(report.wall_x);
    assert(report.paddle_contact);
    assert(report.paddle_hits == 0);
    assert(ball.body.velocity.x == 10);

    Advance(ball.body);
    assert(ball.body.rect.x() == 1);
    report = CollideBall(ball, arena, {&paddle});
    assert(report.paddle_contact);
    assert(ball.body.velocity.x == 10);
}

void TestResetRestoresStart() {
    Ball ball = MakeBall(20, Vec2{400, 250}, Vec2{5, 5}, Color{});
    ball.body.rect.setPosition(Vec2{-17, 999});
    ResetBall(ball, ServeFlip::Vertical);
    assert(ball.body.rect.position() == (Vec2{400, 250}));
    assert(ball.body.velocity == (Vec2{5, -5}));

    ball.body.rect.setPosition(Vec2{123, 45});
    ResetBall(ball, ServeFlip::Horizontal);
    assert(ball.body.rect.position() == (Vec2{400, 250}));
    assert(ball.body.velocity == (Vec2{-5, -5}));
}

void TestSpeedMagnitudeIsInvariant() {
    Arena arena(800, 500);
    Paddle left = MakePaddle(Rect{0, 200, 10, 80}, 10, Side::Player, Color{});
    Paddle right = MakePaddle(Rect{780, 200, 10, 80}, 10, Side::Computer, Color{});
    Ball ball = MakeBall(20, arena.center(), Vec2{5, 3}, Color{});
    for (int tick = 0; tick < 5000; ++tick) {
        Advance(ball.body);
        CollideBall(ball, arena, {&left, &right});
        assert(std::abs(ball.body.velocity.x) == 5);
        assert(std::abs(ball.body.velocity.y) == 3);
        if (ball.body.rect.left() < -20 || ball.body.rect.right() > 820) {
            ResetBall(ball, ServeFlip::Vertical);
        }
    }
}

}  // namespace

int main() {
    TestAdvanceAddsVelocity();
    TestBouncePairsCancel();
    TestLeftAndRightWallsReflect();
    TestTopAndBottomWallsReflect();
    TestBoundaryIsInclusiveAndPurelyReflective();
    TestPaddleReflectsApproachingBall();
    TestTouchingEdgeIsNotACollision();
    TestBallAtWallInsidePaddleIsNotTrapped();
    TestWallBounceBehindComputerPaddleHolds();
    TestFastBallPastPlayerPaddleCenterHolds();
    TestResetRestoresStart();
    TestSpeedMagnitudeIsInvariant();
    std::cout << "All ball tests passed.\n";
    return 0;
}
