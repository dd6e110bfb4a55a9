#pragma once

#include "pong/core/Types.hpp"

namespace pong::core {

class Arena {
public:
    Arena(int width, int height);

    int width() const noexcept { return width_; }
    int height() const noexcept { return height_; }
    Vec2 center() const noexcept { return Vec2{width_ / 2, height_ / 2}; }

private:
    int width_{0};
    int height_{0};
};

}  // namespace pong::core
