#pragma once

#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>

#include <string>
#include <vector>

#include "pong/core/Drawable.hpp"

namespace pong::render {

inline constexpr int kScorePointSize = 64;
inline constexpr SDL_Color kBackground{0, 0, 0, 255};

struct Fonts {
    TTF_Font* score = nullptr;
};

Fonts LoadFonts(int point_size = kScorePointSize);
void DestroyFonts(Fonts& fonts);

void FillEllipse(SDL_Renderer* renderer, const SDL_Rect& bounds);

// Draws text centered on bounds. Returns false if nothing could be drawn.
bool DrawCenteredText(SDL_Renderer* renderer,
                      TTF_Font* font,
                      const SDL_Rect& bounds,
                      const std::string& text,
                      SDL_Color color);

// Clears to the background, draws the drawables in order and presents.
void DrawFrame(SDL_Renderer* renderer,
               const Fonts& fonts,
               const std::vector<pong::core::Drawable>& drawables);

}  // namespace pong::render
