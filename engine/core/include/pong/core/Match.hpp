#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "pong/core/Arena.hpp"
#include "pong/core/Ball.hpp"
#include "pong/core/Control.hpp"
#include "pong/core/Drawable.hpp"
#include "pong/core/GameConfig.hpp"
#include "pong/core/Paddle.hpp"
#include "pong/core/Scorekeeper.hpp"

namespace pong::core {

inline constexpr Color kBallColor{255, 0, 0, 255};
inline constexpr Color kPaddleColor{0, 255, 0, 255};
inline constexpr Color kScoreColor{150, 150, 150, 255};
inline constexpr int kScoreTextHeight = 64;

struct TickReport {
    CollisionReport collision{};
    std::optional<Side> scorer;
};

class Match {
public:
    explicit Match(const GameConfig& config);
    Match(const GameConfig& config, std::unique_ptr<PaddleControl> control);

    // One fixed step: human control, ball motion, collisions, AI, scoring.
    TickReport Step(const InputState& input);

    // Ball, paddles, then score text so the text lands on top.
    std::vector<Drawable> Drawables() const;

    const GameConfig& config() const noexcept { return config_; }
    const Arena& arena() const noexcept { return arena_; }
    const Ball& ball() const noexcept { return ball_; }
    Ball& ball() noexcept { return ball_; }
    const Paddle& player() const noexcept { return player_; }
    Paddle& player() noexcept { return player_; }
    const Paddle& computer() const noexcept { return computer_; }
    Paddle& computer() noexcept { return computer_; }
    const Score& score() const noexcept { return scorekeeper_.score(); }
    const PaddleControl& control() const noexcept { return *control_; }
    std::uint64_t ticks() const noexcept { return ticks_; }

private:
    GameConfig config_;
    Arena arena_;
    Ball ball_;
    Paddle player_;
    Paddle computer_;
    std::unique_ptr<PaddleControl> control_;
    Scorekeeper scorekeeper_;
    std::uint64_t ticks_{0};
};

}  // namespace pong::core
