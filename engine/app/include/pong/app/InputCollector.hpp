#pragma once

#include <optional>
#include <vector>

#include "pong/core/Control.hpp"
#include "pong/platform/InputEvents.hpp"

namespace pong::app {

struct CollectedInput {
    pong::core::InputState state;
    bool quit = false;
};

std::optional<pong::core::Direction> DirectionFor(pong::platform::KeyCode key) noexcept;

// Folds one tick's worth of events into the core's input state.
CollectedInput CollectInput(const std::vector<pong::platform::InputEvent>& events);

}  // namespace pong::app
