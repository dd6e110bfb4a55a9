#include "pong/core/Control.hpp"

#include <stdexcept>

namespace pong::core {

int TargetFollow::ComputeNextPosition(const Paddle& paddle, const InputState& input) {
    if (input.pointer_y) {
        target_ = input.pointer_y;
    }
    if (!target_) {
        return paddle.body.rect.top();
    }
    return StepToward(paddle, *target_);
}

AcceleratingKeyHold::AcceleratingKeyHold(int step) : step_(step) {
    if (step <= 0) {
        throw std::invalid_argument("Key speed step must be positive");
    }
}

void AcceleratingKeyHold::Apply(const KeyEdge& edge) noexcept {
    bool& held = edge.direction == Direction::Up ? up_held_ : down_held_;
    if (edge.pressed == held) {
        return;
    }
    held = edge.pressed;

    const int signed_step = edge.direction == Direction::Down ? step_ : -step_;
    speed_ += edge.pressed ? signed_step : -signed_step;
}

int AcceleratingKeyHold::ComputeNextPosition(const Paddle& paddle, const InputState& input) {
    for (const auto& edge : input.key_edges) {
        Apply(edge);
    }
    return paddle.body.rect.top() + speed_;
}

std::unique_ptr<PaddleControl> MakeControl(ControlScheme scheme, int key_step) {
    switch (scheme) {
        case ControlScheme::TargetFollow:
            return std::make_unique<TargetFollow>();
        case ControlScheme::AcceleratingKeyHold:
            return std::make_unique<AcceleratingKeyHold>(key_step);
    }
    throw std::invalid_argument("Unknown control scheme");
}

}  // namespace pong::core
