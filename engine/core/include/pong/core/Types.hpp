#pragma once

#include <cstdint>

namespace pong::core {

struct Vec2 {
    std::int32_t x{};
    std::int32_t y{};

    constexpr bool operator==(const Vec2& other) const noexcept {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Vec2& other) const noexcept {
        return !(*this == other);
    }
};

struct Color {
    std::uint8_t r{255};
    std::uint8_t g{255};
    std::uint8_t b{255};
    std::uint8_t a{255};
};

// Axis-aligned box. Size is fixed at construction, position is free.
class Rect {
public:
    Rect(int x, int y, int width, int height);

    int x() const noexcept { return x_; }
    int y() const noexcept { return y_; }
    int width() const noexcept { return width_; }
    int height() const noexcept { return height_; }

    int left() const noexcept { return x_; }
    int right() const noexcept { return x_ + width_; }
    int top() const noexcept { return y_; }
    int bottom() const noexcept { return y_ + height_; }
    int centerX() const noexcept { return x_ + width_ / 2; }
    int centerY() const noexcept { return y_ + height_ / 2; }
    Vec2 position() const noexcept { return Vec2{x_, y_}; }

    void setPosition(const Vec2& position) noexcept {
        x_ = position.x;
        y_ = position.y;
    }
    void setX(int x) noexcept { x_ = x; }
    void setY(int y) noexcept { y_ = y; }
    void setTop(int top) noexcept { y_ = top; }
    void setBottom(int bottom) noexcept { y_ = bottom - height_; }
    void translate(int dx, int dy) noexcept {
        x_ += dx;
        y_ += dy;
    }

    // Open-box overlap; rectangles that only share an edge do not intersect.
    bool intersects(const Rect& other) const noexcept;

private:
    int x_{0};
    int y_{0};
    int width_{1};
    int height_{1};
};

}  // namespace pong::core
