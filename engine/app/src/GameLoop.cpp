#include "pong/app/GameLoop.hpp"

#include <SDL2/SDL.h>

#include "pong/app/InputCollector.hpp"

namespace pong::app {

GameLoop::GameLoop(pong::core::Match& match, Frontend& frontend)
    : match_(match), frontend_(frontend) {}

bool GameLoop::Tick() {
    if (state_ == LoopState::Terminated) {
        return false;
    }

    const CollectedInput input = CollectInput(frontend_.PollEvents());
    if (input.quit) {
        state_ = LoopState::Terminated;
        SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "Quit after %llu ticks",
                    static_cast<unsigned long long>(match_.ticks()));
        return false;
    }

    const pong::core::TickReport report = match_.Step(input.state);
    if (report.scorer) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "%s scores: %d - %d",
                     pong::core::SideName(*report.scorer), match_.score().player,
                     match_.score().computer);
    }

    frontend_.PlaySounds(report);
    frontend_.DrawFrame(match_.Drawables());
    frontend_.WaitForTick(match_.config().fps);
    return true;
}

std::uint64_t GameLoop::RunTicks(std::uint64_t max_ticks) {
    std::uint64_t processed = 0;
    while (processed < max_ticks && Tick()) {
        ++processed;
    }
    return processed;
}

int GameLoop::Run() {
    while (Tick()) {
    }
    return 0;
}

}  // namespace pong::app
