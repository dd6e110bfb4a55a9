#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "pong/core/Paddle.hpp"

namespace pong::core {

enum class Direction { Up, Down };

struct KeyEdge {
    Direction direction = Direction::Up;
    bool pressed = false;
};

// Input gathered for one tick. Pointer position is last-writer-wins, key
// edges are kept in arrival order.
struct InputState {
    std::optional<int> pointer_y;
    std::vector<KeyEdge> key_edges;
};

enum class ControlScheme { TargetFollow, AcceleratingKeyHold };

class PaddleControl {
public:
    virtual ~PaddleControl() = default;

    // Returns the paddle's new top edge. Clamping is left to the caller.
    virtual int ComputeNextPosition(const Paddle& paddle, const InputState& input) = 0;

    virtual ControlScheme scheme() const noexcept = 0;
};

class TargetFollow : public PaddleControl {
public:
    int ComputeNextPosition(const Paddle& paddle, const InputState& input) override;
    ControlScheme scheme() const noexcept override { return ControlScheme::TargetFollow; }

    const std::optional<int>& target() const noexcept { return target_; }

private:
    std::optional<int> target_;
};

class AcceleratingKeyHold : public PaddleControl {
public:
    explicit AcceleratingKeyHold(int step);

    int ComputeNextPosition(const Paddle& paddle, const InputState& input) override;
    ControlScheme scheme() const noexcept override { return ControlScheme::AcceleratingKeyHold; }

    int speed() const noexcept { return speed_; }
    int step() const noexcept { return step_; }

private:
    void Apply(const KeyEdge& edge) noexcept;

    int step_{0};
    int speed_{0};
    bool up_held_{false};
    bool down_held_{false};
};

std::unique_ptr<PaddleControl> MakeControl(ControlScheme scheme, int key_step);

}  // namespace pong::core
