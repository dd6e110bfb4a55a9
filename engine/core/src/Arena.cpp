#include "pong/core/Arena.hpp"

#include <stdexcept>
#include <string>

namespace pong::core {

Arena::Arena(int width, int height) : width_(width), height_(height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Arena size must be positive, got " + std::to_string(width) +
                                    "x" + std::to_string(height));
    }
}

}  // namespace pong::core
