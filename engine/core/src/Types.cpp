#include "pong/core/Types.hpp"

#include <stdexcept>
#include <string>

namespace pong::core {

Rect::Rect(int x, int y, int width, int height) : x_(x), y_(y), width_(width), height_(height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Rect size must be positive, got " + std::to_string(width) +
                                    "x" + std::to_string(height));
    }
}

bool Rect::intersects(const Rect& other) const noexcept {
    return left() < other.right() && other.left() < right() && top() < other.bottom() &&
           other.top() < bottom();
}

}  // namespace pong::core
