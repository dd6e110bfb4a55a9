#pragma once

#include <optional>

#include "pong/core/Arena.hpp"
#include "pong/core/Ball.hpp"
#include "pong/core/Paddle.hpp"

namespace pong::core {

struct Score {
    int player = 0;
    int computer = 0;

    int of(Side side) const noexcept { return side == Side::Player ? player : computer; }
};

class Scorekeeper {
public:
    Scorekeeper() = default;

    // Awards a point and serves again when the ball has reached an open side
    // of the arena. A tick in which a paddle touched the ball never scores.
    std::optional<Side> Update(Ball& ball, const Arena& arena, ServeFlip flip, bool defended);

    const Score& score() const noexcept { return score_; }

private:
    Score score_{};
};

}  // namespace pong::core
