#include "pong/core/Body.hpp"

namespace pong::core {

void Advance(Body& body) noexcept {
    body.rect.translate(body.velocity.x, body.velocity.y);
}

void BounceX(Body& body) noexcept {
    body.velocity.x = -body.velocity.x;
}

void BounceY(Body& body) noexcept {
    body.velocity.y = -body.velocity.y;
}

void ClampToArena(Body& body, const Arena& arena) noexcept {
    if (body.rect.top() < 0) {
        body.rect.setTop(0);
    }
    if (body.rect.bottom() > arena.height()) {
        body.rect.setBottom(arena.height());
    }
}

}  // namespace pong::core
