#include <cassert>
#include <iostream>

#include "pong/core/Scorekeeper.hpp"

using namespace pong::core;

namespace {

Ball MakeTestBall() {
    return MakeBall(20, Vec2{400, 250}, Vec2{-5, 5}, Color{});
}

void TestLeftExitScoresForPlayer() {
    Arena arena(800, 500);
    Scorekeeper keeper;
    Ball ball = MakeTestBall();
    ball.body.rect.setPosition(Vec2{-1, 300});

    auto scorer = keeper.Update(ball, arena, ServeFlip::Vertical, false);
    assert(scorer && *scorer == Side::Player);
    assert(keeper.score().player == 1);
    assert(keeper.score().computer == 0);
    assert(ball.body.rect.position() == (Vec2{400, 250}));
    assert(ball.body.velocity == (Vec2{-5, -5}));
}

void TestRightExitScoresForComputer() {
    Arena arena(800, 500);
    Scorekeeper keeper;
    Ball ball = MakeTestBall();
    ball.body.rect.setPosition(Vec2{780, 100});

    auto scorer = keeper.Update(ball, arena, ServeFlip::Horizontal, false);
    assert(scorer && *scorer == Side::Computer);
    assert(keeper.score().player == 0);
    assert(keeper.score().computer == 1);
    assert(keeper.score().of(Side::Computer) == 1);
    assert(ball.body.rect.position() == (Vec2{400, 250}));
    assert(ball.body.velocity == (Vec2{5, 5}));
}

void TestBallInPlayDoesNotScore() {
    Arena arena(800, 500);
    Scorekeeper keeper;
    Ball ball = MakeTestBall();
    ball.body.rect.setPosition(Vec2{1, 0});
    assert(!keeper.Update(ball, arena, ServeFlip::Vertical, false));
    ball.body.rect.setPosition(Vec2{779, 480});
    assert(!keeper.Update(ball, arena, ServeFlip::Vertical, false));
    assert(keeper.score().player == 0 && keeper.score().computer == 0);
    assert(ball.body.rect.position() == (Vec2{779, 480}));
}

void TestDefendedTickNeverScores() {
    Arena arena(800, 500);
    Scorekeeper keeper;
    Ball ball = MakeTestBall();
    ball.body.rect.setPosition(Vec2{0, 250});
    assert(!keeper.Update(ball, arena, ServeFlip::Vertical, true));
    assert(keeper.score().player == 0);
    assert(ball.body.rect.x() == 0);
}

void TestScoresAccumulate() {
    Arena arena(800, 500);
    Scorekeeper keeper;
    Ball ball = MakeTestBall();
    for (int i = 0; i < 3; ++i) {
        ball.body.rect.setPosition(Vec2{-4, 10});
        keeper.Update(ball, arena, ServeFlip::Vertical, false);
    }
    ball.body.rect.setPosition(Vec2{800, 10});
    keeper.Update(ball, arena, ServeFlip::Vertical, false);
    assert(keeper.score().player == 3);
    assert(keeper.score().computer == 1);
}

}  // namespace

int main() {
    TestLeftExitScoresForPlayer();
    TestRightExitScoresForComputer();
    TestBallInPlayDoesNotScore();
    TestDefendedTickNeverScores();
    TestScoresAccumulate();
    std::cout << "All scorekeeper tests passed.\n";
    return 0;
}
