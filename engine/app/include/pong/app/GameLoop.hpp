#pragma once

#include <cstdint>

#include "pong/app/Frontend.hpp"
#include "pong/core/Match.hpp"

namespace pong::app {

enum class LoopState { Running, Terminated };

class GameLoop {
public:
    GameLoop(pong::core::Match& match, Frontend& frontend);

    // Runs until the frontend reports quit. Returns the process exit code.
    int Run();

    // Runs at most max_ticks ticks; returns how many were processed.
    std::uint64_t RunTicks(std::uint64_t max_ticks);

    // One tick. Returns false, without stepping the match, once quit is seen.
    bool Tick();

    LoopState state() const noexcept { return state_; }

private:
    pong::core::Match& match_;
    Frontend& frontend_;
    LoopState state_ = LoopState::Running;
};

}  // namespace pong::app
