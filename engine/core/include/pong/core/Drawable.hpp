#pragma once

#include <string>

#include "pong/core/Types.hpp"

namespace pong::core {

enum class Shape { Rectangle, Ellipse, Text };

// One entry of the frame handed to the renderer. Text is centered on bounds.
struct Drawable {
    Shape shape = Shape::Rectangle;
    Rect bounds;
    Color color{};
    std::string text;
};

}  // namespace pong::core
