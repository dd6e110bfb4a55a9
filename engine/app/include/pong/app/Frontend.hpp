#pragma once

#include <vector>

#include "pong/core/Drawable.hpp"
#include "pong/core/Match.hpp"
#include "pong/platform/InputEvents.hpp"

namespace pong::app {

// Everything the game loop needs from the outside world: events in, frames
// and sounds out, and the frame-rate wait.
class Frontend {
public:
    virtual ~Frontend() = default;

    virtual std::vector<pong::platform::InputEvent> PollEvents() = 0;
    virtual void DrawFrame(const std::vector<pong::core::Drawable>& drawables) = 0;
    virtual void PlaySounds(const pong::core::TickReport& report) = 0;
    virtual void WaitForTick(int fps) = 0;
};

}  // namespace pong::app
