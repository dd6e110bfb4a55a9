#include <cassert>
#include <iostream>

#include "pong/core/AI.hpp"

using namespace pong::core;

namespace {

void TestPursuitClosesGapAtMaxSpeed() {
    Arena arena(800, 500);
    Paddle paddle = MakePaddle(Rect{780, 100, 10, 80}, 10, Side::Computer, Color{});
    // Ball center sits 50 px below the paddle's top edge.
    Ball ball = MakeBall(20, Vec2{400, 140}, Vec2{0, 0}, Color{});
    assert(ai::PursuitTarget(ball) == 150);

    const int expected[] = {110, 120, 130, 140, 150, 150};
    for (int top : expected) {
        ai::Pursue(paddle, ball, arena);
        assert(paddle.body.rect.top() == top);
    }
}

void TestPursuitMatchesRemainingDelta() {
    Arena arena(800, 500);
    Paddle paddle = MakePaddle(Rect{780, 100, 10, 80}, 10, Side::Computer, Color{});
    Ball ball = MakeBall(20, Vec2{400, 84}, Vec2{0, 0}, Color{});
    ai::Pursue(paddle, ball, arena);
    assert(paddle.body.rect.top() == 94);
}

void TestPursuitUsesCurrentPositionOnly() {
    Arena arena(800, 500);
    Paddle paddle = MakePaddle(Rect{780, 200, 10, 80}, 10, Side::Computer, Color{});
    Ball fast = MakeBall(20, Vec2{400, 190}, Vec2{5, 100}, Color{});
    ai::Pursue(paddle, fast, arena);
    assert(paddle.body.rect.top() == 200);
}

void TestPursuitIsClampedToArena() {
    Arena arena(800, 500);
    Paddle paddle = MakePaddle(Rect{780, 415, 10, 80}, 10, Side::Computer, Color{});
    Ball ball = MakeBall(20, Vec2{400, 480}, Vec2{0, 0}, Color{});
    ai::Pursue(paddle, ball, arena);
    assert(paddle.body.rect.bottom() == 500);

    paddle.body.rect.setTop(5);
    Ball high = MakeBall(20, Vec2{400, -30}, Vec2{0, 0}, Color{});
    ai::Pursue(paddle, high, arena);
    assert(paddle.body.rect.top() == 0);
}

}  // namespace

int main() {
    TestPursuitClosesGapAtMaxSpeed();
    TestPursuitMatchesRemainingDelta();
    TestPursuitUsesCurrentPositionOnly();
    TestPursuitIsClampedToArena();
    std::cout << "All AI tests passed.\n";
    return 0;
}
