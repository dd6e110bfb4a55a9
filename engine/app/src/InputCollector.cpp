#include "pong/app/InputCollector.hpp"

namespace pong::app {

using pong::platform::InputEventType;
using pong::platform::KeyCode;

std::optional<pong::core::Direction> DirectionFor(KeyCode key) noexcept {
    switch (key) {
        case KeyCode::Up:
        case KeyCode::W:
            return pong::core::Direction::Up;
        case KeyCode::Down:
        case KeyCode::S:
            return pong::core::Direction::Down;
        default:
            return std::nullopt;
    }
}

CollectedInput CollectInput(const std::vector<pong::platform::InputEvent>& events) {
    CollectedInput collected;
    for (const auto& evt : events) {
        switch (evt.type) {
            case InputEventType::Quit:
                collected.quit = true;
                break;
            case InputEventType::MouseMove:
                collected.state.pointer_y = evt.y;
                break;
            case InputEventType::KeyDown:
            case InputEventType::KeyUp: {
                const bool pressed = evt.type == InputEventType::KeyDown;
                if (pressed && evt.key == KeyCode::Escape) {
                    collected.quit = true;
                    break;
                }
                if (auto direction = DirectionFor(evt.key)) {
                    collected.state.key_edges.push_back(pong::core::KeyEdge{*direction, pressed});
                }
                break;
            }
        }
    }
    return collected;
}

}  // namespace pong::app
