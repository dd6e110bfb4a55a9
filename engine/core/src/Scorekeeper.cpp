#include "pong/core/Scorekeeper.hpp"

namespace pong::core {

std::optional<Side> Scorekeeper::Update(Ball& ball,
                                        const Arena& arena,
                                        ServeFlip flip,
                                        bool defended) {
    if (defended) {
        return std::nullopt;
    }

    std::optional<Side> scorer;
    if (ball.body.rect.left() <= 0) {
        ++score_.player;
        scorer = Side::Player;
    } else if (ball.body.rect.right() >= arena.width()) {
        ++score_.computer;
        scorer = Side::Computer;
    }

    if (scorer) {
        ResetBall(ball, flip);
    }
    return scorer;
}

}  // namespace pong::core
