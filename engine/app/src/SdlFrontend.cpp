#include "pong/app/SdlFrontend.hpp"

#include <SDL2/SDL_image.h>
#include <SDL2/SDL_mixer.h>

#include <filesystem>

#include "pong/app/AssetFS.hpp"

namespace pong::app {

namespace {

void ApplyWindowIcon(SDL_Window* window) {
    std::filesystem::path path = AssetPath("icon.png");
    if (!FileExists(path)) {
        return;
    }
    SDL_Surface* icon = IMG_Load(path.string().c_str());
    if (!icon) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Failed to load window icon: %s",
                    IMG_GetError());
        return;
    }
    SDL_SetWindowIcon(window, icon);
    SDL_FreeSurface(icon);
}

}  // namespace

SdlFrontend::~SdlFrontend() {
    Shutdown();
}

bool SdlFrontend::Initialize(const pong::core::GameConfig& config) {
    window_ = SDL_CreateWindow(config.title.c_str(), SDL_WINDOWPOS_CENTERED,
                               SDL_WINDOWPOS_CENTERED, config.arena_width, config.arena_height,
                               SDL_WINDOW_SHOWN);
    if (!window_) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_CreateWindow failed: %s", SDL_GetError());
        return false;
    }
    ApplyWindowIcon(window_);

    renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED);
    if (!renderer_) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Accelerated renderer unavailable (%s), falling back to software",
                    SDL_GetError());
        renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_SOFTWARE);
    }
    if (!renderer_) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_CreateRenderer failed: %s",
                     SDL_GetError());
        Shutdown();
        return false;
    }

    fonts_ = pong::render::LoadFonts();
    if (!fonts_.score) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Unable to load required fonts.");
        Shutdown();
        return false;
    }

    if (!input_.Initialize()) {
        Shutdown();
        return false;
    }

    if (!audio_.Initialize()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Audio disabled: %s", Mix_GetError());
    }

    frequency_ = static_cast<double>(SDL_GetPerformanceFrequency());
    last_counter_ = SDL_GetPerformanceCounter();
    return true;
}

void SdlFrontend::Shutdown() {
    audio_.Shutdown();
    input_.Shutdown();
    pong::render::DestroyFonts(fonts_);
    if (renderer_) {
        SDL_DestroyRenderer(renderer_);
        renderer_ = nullptr;
    }
    if (window_) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }
}

std::vector<pong::platform::InputEvent> SdlFrontend::PollEvents() {
    return input_.Poll();
}

void SdlFrontend::DrawFrame(const std::vector<pong::core::Drawable>& drawables) {
    pong::render::DrawFrame(renderer_, fonts_, drawables);
}

void SdlFrontend::PlaySounds(const pong::core::TickReport& report) {
    if (report.scorer) {
        audio_.PlayScore();
    } else if (report.collision.paddle_hits > 0) {
        audio_.PlayPaddleHit();
    } else if (report.collision.wall_x || report.collision.wall_y) {
        audio_.PlayWallBounce();
    }
}

void SdlFrontend::WaitForTick(int fps) {
    const double budget_ms = 1000.0 / fps;
    const double elapsed_ms =
        static_cast<double>(SDL_GetPerformanceCounter() - last_counter_) * 1000.0 / frequency_;
    if (elapsed_ms < budget_ms) {
        SDL_Delay(static_cast<Uint32>(budget_ms - elapsed_ms));
    }
    last_counter_ = SDL_GetPerformanceCounter();
}

}  // namespace pong::app
