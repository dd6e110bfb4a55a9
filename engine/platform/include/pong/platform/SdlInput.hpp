#pragma once

#include <SDL2/SDL.h>

#include <vector>

#include "pong/platform/InputEvents.hpp"

namespace pong::platform {

class SdlInput {
public:
    SdlInput() = default;
    ~SdlInput();

    bool Initialize();
    void Shutdown();

    // Drains every pending SDL event. Key auto-repeat is dropped so that
    // KeyDown/KeyUp always come in pairs.
    std::vector<InputEvent> Poll();

private:
    bool initialized_ = false;
};

KeyCode ToKey(SDL_Keycode key);

}  // namespace pong::platform
