#include "pong/render/SceneRenderer.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <string>

#include "pong/app/AssetFS.hpp"

namespace pong::render {

namespace {

TTF_Font* LoadFontFromCandidates(const std::vector<std::filesystem::path>& candidates,
                                 int point_size) {
    for (const auto& candidate : candidates) {
        if (!pong::app::FileExists(candidate)) {
            continue;
        }
        TTF_Font* font = TTF_OpenFont(candidate.string().c_str(), point_size);
        if (font) {
            TTF_SetFontHinting(font, TTF_HINTING_LIGHT);
            return font;
        }
        SDL_LogWarn(SDL_LOG_CATEGORY_RENDER, "Failed to open font %s: %s",
                    candidate.string().c_str(), TTF_GetError());
    }
    return nullptr;
}

SDL_Rect ToSdlRect(const pong::core::Rect& rect) {
    return SDL_Rect{rect.x(), rect.y(), rect.width(), rect.height()};
}

SDL_Color ToSdlColor(const pong::core::Color& color) {
    return SDL_Color{color.r, color.g, color.b, color.a};
}

}  // namespace

Fonts LoadFonts(int point_size) {
    std::vector<std::filesystem::path> search_paths = {
        pong::app::AssetPath("fonts/score.ttf"),
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
        "/usr/share/fonts/dejavu/DejaVuSans.ttf",
        "/Library/Fonts/Arial.ttf",
        "C:/Windows/Fonts/arial.ttf",
    };

    Fonts fonts;
    fonts.score = LoadFontFromCandidates(search_paths, point_size);
    return fonts;
}

void DestroyFonts(Fonts& fonts) {
    if (fonts.score) {
        TTF_CloseFont(fonts.score);
        fonts.score = nullptr;
    }
}

void FillEllipse(SDL_Renderer* renderer, const SDL_Rect& bounds) {
    const double rx = bounds.w / 2.0;
    const double ry = bounds.h / 2.0;
    const double cx = bounds.x + rx;
    const double cy = bounds.y + ry;
    for (int row = 0; row < bounds.h; ++row) {
        const double dy = (row + 0.5 - ry) / ry;
        const double span = rx * std::sqrt(std::max(0.0, 1.0 - dy * dy));
        const int x0 = static_cast<int>(std::lround(cx - span));
        const int x1 = static_cast<int>(std::lround(cx + span)) - 1;
        if (x1 < x0) {
            continue;
        }
        const int y = bounds.y + row;
        SDL_RenderDrawLine(renderer, x0, y, x1, y);
    }
}

bool DrawCenteredText(SDL_Renderer* renderer,
                      TTF_Font* font,
                      const SDL_Rect& bounds,
                      const std::string& text,
                      SDL_Color color) {
    if (!font || text.empty()) {
        return false;
    }
    SDL_Surface* surface = TTF_RenderUTF8_Blended(font, text.c_str(), color);
    if (!surface) {
        return false;
    }
    SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, surface);
    if (!texture) {
        SDL_FreeSurface(surface);
        return false;
    }
    SDL_Rect dst{bounds.x + (bounds.w - surface->w) / 2, bounds.y + (bounds.h - surface->h) / 2,
                 surface->w, surface->h};
    SDL_RenderCopy(renderer, texture, nullptr, &dst);
    SDL_DestroyTexture(texture);
    SDL_FreeSurface(surface);
    return true;
}

void DrawFrame(SDL_Renderer* renderer,
               const Fonts& fonts,
               const std::vector<pong::core::Drawable>& drawables) {
    SDL_SetRenderDrawColor(renderer, kBackground.r, kBackground.g, kBackground.b, kBackground.a);
    SDL_RenderClear(renderer);

    for (const auto& drawable : drawables) {
        const SDL_Rect bounds = ToSdlRect(drawable.bounds);
        const SDL_Color color = ToSdlColor(drawable.color);
        SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
        switch (drawable.shape) {
            case pong::core::Shape::Rectangle:
                SDL_RenderFillRect(renderer, &bounds);
                break;
            case pong::core::Shape::Ellipse:
                FillEllipse(renderer, bounds);
                break;
            case pong::core::Shape::Text:
                DrawCenteredText(renderer, fonts.score, bounds, drawable.text, color);
                break;
        }
    }

    SDL_RenderPresent(renderer);
}

}  // namespace pong::render
