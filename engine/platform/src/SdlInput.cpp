#include "pong/platform/SdlInput.hpp"

#include <SDL2/SDL.h>

namespace pong::platform {

KeyCode ToKey(SDL_Keycode key) {
    switch (key) {
        case SDLK_ESCAPE:
            return KeyCode::Escape;
        case SDLK_UP:
            return KeyCode::Up;
        case SDLK_DOWN:
            return KeyCode::Down;
        case SDLK_w:
            return KeyCode::W;
        case SDLK_s:
            return KeyCode::S;
        default:
            return KeyCode::Unknown;
    }
}

SdlInput::~SdlInput() {
    Shutdown();
}

bool SdlInput::Initialize() {
    if (initialized_) {
        return true;
    }
    if (SDL_WasInit(SDL_INIT_EVENTS) == 0 && SDL_InitSubSystem(SDL_INIT_EVENTS) != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_INPUT, "SDL events unavailable: %s", SDL_GetError());
        return false;
    }
    initialized_ = true;
    return true;
}

void SdlInput::Shutdown() {
    initialized_ = false;
}

std::vector<InputEvent> SdlInput::Poll() {
    std::vector<InputEvent> events;
    SDL_Event sdl_event;
    while (SDL_PollEvent(&sdl_event)) {
        InputEvent evt;
        switch (sdl_event.type) {
            case SDL_QUIT:
                evt.type = InputEventType::Quit;
                events.push_back(evt);
                break;
            case SDL_MOUSEMOTION:
                evt.type = InputEventType::MouseMove;
                evt.x = sdl_event.motion.x;
                evt.y = sdl_event.motion.y;
                events.push_back(evt);
                break;
            case SDL_KEYDOWN:
                if (sdl_event.key.repeat != 0) {
                    break;
                }
                evt.type = InputEventType::KeyDown;
                evt.key = ToKey(sdl_event.key.keysym.sym);
                events.push_back(evt);
                break;
            case SDL_KEYUP:
                evt.type = InputEventType::KeyUp;
                evt.key = ToKey(sdl_event.key.keysym.sym);
                events.push_back(evt);
                break;
            default:
                break;
        }
    }
    return events;
}

}  // namespace pong::platform
