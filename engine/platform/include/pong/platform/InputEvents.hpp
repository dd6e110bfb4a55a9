#pragma once

namespace pong::platform {

enum class InputEventType {
    Quit,
    MouseMove,
    KeyDown,
    KeyUp,
};

enum class KeyCode {
    Escape,
    Up,
    Down,
    W,
    S,
    Unknown
};

struct InputEvent {
    InputEventType type = InputEventType::Quit;
    int x = 0;
    int y = 0;
    KeyCode key = KeyCode::Unknown;
};

}  // namespace pong::platform
