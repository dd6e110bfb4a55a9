#pragma once

#include "pong/core/Arena.hpp"
#include "pong/core/Types.hpp"

namespace pong::core {

// Shared state of everything that moves in the arena. Behaviour lives in the
// free functions below rather than in a class hierarchy.
struct Body {
    Rect rect;
    Vec2 velocity{};
    Color color{};
};

void Advance(Body& body) noexcept;

void BounceX(Body& body) noexcept;
void BounceY(Body& body) noexcept;

// Keeps the body inside the arena on the vertical axis.
void ClampToArena(Body& body, const Arena& arena) noexcept;

inline bool Overlaps(const Body& a, const Body& b) noexcept {
    return a.rect.intersects(b.rect);
}

}  // namespace pong::core
