#define SDL_MAIN_HANDLED

#include <exception>

#include <SDL2/SDL.h>
#include <SDL2/SDL_image.h>
#include <SDL2/SDL_main.h>
#include <SDL2/SDL_ttf.h>

#include "pong/app/ConfigLoader.hpp"
#include "pong/app/GameLoop.hpp"
#include "pong/app/SdlFrontend.hpp"
#include "pong/core/GameConfig.hpp"
#include "pong/core/Match.hpp"

using pong::app::GameLoop;
using pong::app::SdlFrontend;
using pong::core::GameConfig;
using pong::core::Match;

int main(int /*argc*/, char* /*argv*/[]) {
    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS) != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_Init failed: %s", SDL_GetError());
        return 1;
    }

    const int img_flags = IMG_INIT_PNG;
    int img_result = IMG_Init(img_flags);
    if ((img_result & img_flags) != img_flags) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "IMG_Init failed: %s", IMG_GetError());
    }

    if (TTF_Init() != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "TTF_Init failed: %s", TTF_GetError());
        if (img_result != 0) {
            IMG_Quit();
        }
        SDL_Quit();
        return 1;
    }

    int exit_code = 1;
    try {
        const GameConfig config = pong::app::LoadGameConfig();
        SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "Arena %dx%d at %d fps, %s control, %s serve",
                    config.arena_width, config.arena_height, config.fps,
                    pong::core::ControlSchemeName(config.control),
                    pong::core::ServeFlipName(config.serve_flip));

        Match match(config);
        SdlFrontend frontend;
        if (frontend.Initialize(config)) {
            GameLoop loop(match, frontend);
            exit_code = loop.Run();
        }
    } catch (const std::exception& ex) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Startup failed: %s", ex.what());
    }

    TTF_Quit();
    if (img_result != 0) {
        IMG_Quit();
    }
    SDL_Quit();
    return exit_code;
}
