#include "pong/core/Match.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "pong/core/AI.hpp"

namespace pong::core {

namespace {

const GameConfig& Validated(const GameConfig& config) {
    config.Validate();
    return config;
}

Paddle PlacePaddle(const GameConfig& config, Side side) {
    const int x = side == Side::Player ? 0 : config.arena_width - 2 * config.paddle_width;
    const int max_speed =
        side == Side::Player ? config.player_max_speed : config.computer_max_speed;
    return MakePaddle(Rect{x, config.arena_height / 2, config.paddle_width, config.paddle_height},
                      max_speed, side, kPaddleColor);
}

Drawable ScoreLine(const Arena& arena, double height_fraction, std::string text) {
    const int center_y = static_cast<int>(std::lround(arena.height() * height_fraction));
    return Drawable{Shape::Text,
                    Rect{0, center_y - kScoreTextHeight / 2, arena.width(), kScoreTextHeight},
                    kScoreColor, std::move(text)};
}

}  // namespace

Match::Match(const GameConfig& config)
    : Match(config, MakeControl(config.control, config.key_step)) {}

Match::Match(const GameConfig& config, std::unique_ptr<PaddleControl> control)
    : config_(Validated(config)),
      arena_(config.arena_width, config.arena_height),
      ball_(MakeBall(config.ball_size, arena_.center(),
                     Vec2{config.ball_speed_x, config.ball_speed_y}, kBallColor)),
      player_(PlacePaddle(config, Side::Player)),
      computer_(PlacePaddle(config, Side::Computer)),
      control_(std::move(control)) {
    if (!control_) {
        throw std::invalid_argument("Match requires a paddle control");
    }
}

TickReport Match::Step(const InputState& input) {
    TickReport report;

    player_.body.rect.setTop(control_->ComputeNextPosition(player_, input));
    ClampToArena(player_.body, arena_);

    Advance(ball_.body);
    report.collision = CollideBall(ball_, arena_, {&player_, &computer_});

    ai::Pursue(computer_, ball_, arena_);

    report.scorer =
        scorekeeper_.Update(ball_, arena_, config_.serve_flip, report.collision.defended());

    ++ticks_;
    return report;
}

std::vector<Drawable> Match::Drawables() const {
    std::vector<Drawable> drawables;
    drawables.reserve(5);
    drawables.push_back(Drawable{Shape::Ellipse, ball_.body.rect, ball_.body.color, {}});
    drawables.push_back(Drawable{Shape::Rectangle, player_.body.rect, player_.body.color, {}});
    drawables.push_back(Drawable{Shape::Rectangle, computer_.body.rect, computer_.body.color, {}});
    drawables.push_back(ScoreLine(arena_, 0.3, "Player: " + std::to_string(score().player)));
    drawables.push_back(ScoreLine(arena_, 0.7, "Computer: " + std::to_string(score().computer)));
    return drawables;
}

}  // namespace pong::core
