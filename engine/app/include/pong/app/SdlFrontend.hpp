#pragma once

#include <SDL2/SDL.h>

#include <vector>

#include "pong/app/Frontend.hpp"
#include "pong/core/GameConfig.hpp"
#include "pong/platform/AudioSystem.hpp"
#include "pong/platform/SdlInput.hpp"
#include "pong/render/SceneRenderer.hpp"

namespace pong::app {

// SDL2 window, renderer, fonts, input and audio. SDL, SDL_ttf and SDL_image
// must already be initialised by the caller.
class SdlFrontend : public Frontend {
public:
    SdlFrontend() = default;
    ~SdlFrontend() override;

    SdlFrontend(const SdlFrontend&) = delete;
    SdlFrontend& operator=(const SdlFrontend&) = delete;

    // Returns false on a fatal failure; the cause has been logged.
    bool Initialize(const pong::core::GameConfig& config);
    void Shutdown();

    std::vector<pong::platform::InputEvent> PollEvents() override;
    void DrawFrame(const std::vector<pong::core::Drawable>& drawables) override;
    void PlaySounds(const pong::core::TickReport& report) override;
    void WaitForTick(int fps) override;

private:
    SDL_Window* window_ = nullptr;
    SDL_Renderer* renderer_ = nullptr;
    pong::render::Fonts fonts_{};
    pong::platform::SdlInput input_;
    pong::platform::AudioSystem audio_;
    Uint64 last_counter_ = 0;
    double frequency_ = 1.0;
};

}  // namespace pong::app
