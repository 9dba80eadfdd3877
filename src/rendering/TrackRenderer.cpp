#include "racetrack/rendering/TrackRenderer.h"

#include "racetrack/rendering/Palette.h"
#include "racetrack/rendering/Primitives.h"

#include <SDL.h>

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>

namespace racetrack::rendering {

namespace {

constexpr int kGridLineWidth = 2;
constexpr float kOutlineRatio = 0.2F;
constexpr float kButtonRadiusRatio = 0.4F;
constexpr float kIconInset = 0.1F;
constexpr float kIconScale = 0.8F;

struct SurfaceDeleter {
    void operator()(SDL_Surface* surface) const { SDL_FreeSurface(surface); }
};

struct RendererDeleter {
    void operator()(SDL_Renderer* renderer) const { SDL_DestroyRenderer(renderer); }
};

void drawCell(SDL_Renderer* renderer, const track::RaceTrack& track, track::Cell cell, float cellW, float cellH) {
    const float x = static_cast<float>(cell.col) * cellW;
    const float y = static_cast<float>(cell.row) * cellH;
    const SDL_Rect bounds = SnapRect(x, y, cellW, cellH);
    const SDL_FRect iconBox{x + kIconInset * cellW, y + kIconInset * cellH, kIconScale * cellW, kIconScale * cellH};
    const Color color = PaletteColor(track.colorAt(cell));

    if (track.hasWall(cell)) {
        SetDrawColor(renderer, color);
        if (track.isActive(cell)) {
            FillRect(renderer, bounds);
        } else {
            DrawRectOutline(renderer, bounds, static_cast<int>(kOutlineRatio * cellW));
        }
    } else if (track.isButton(cell)) {
        SetDrawColor(renderer, color);
        FillCircle(renderer, x + cellW * 0.5F, y + cellH * 0.5F, kButtonRadiusRatio * std::min(cellW, cellH));
    } else if (cell == track.target()) {
        DrawStarIcon(renderer, iconBox);
    }

    if (cell == track.spawn()) {
        DrawSpawnIcon(renderer, iconBox);
    }

    SetDrawColor(renderer, kGridLineColor);
    DrawRectOutline(renderer, bounds, kGridLineWidth);
}

Image copyPixels(SDL_Surface* surface) {
    Image image{};
    image.width = surface->w;
    image.height = surface->h;
    image.pixels.resize(static_cast<std::size_t>(surface->w) * static_cast<std::size_t>(surface->h));

    const bool mustLock = SDL_MUSTLOCK(surface);
    if (mustLock && SDL_LockSurface(surface) != 0) {
        throw std::runtime_error(std::string("Failed to lock track surface: ") + SDL_GetError());
    }
    const auto* base = static_cast<const unsigned char*>(surface->pixels);
    const std::size_t rowBytes = static_cast<std::size_t>(surface->w) * sizeof(std::uint32_t);
    for (int row = 0; row < surface->h; ++row) {
        std::memcpy(image.pixels.data() + static_cast<std::size_t>(row) * static_cast<std::size_t>(surface->w),
                    base + static_cast<std::size_t>(row) * static_cast<std::size_t>(surface->pitch),
                    rowBytes);
    }
    if (mustLock) {
        SDL_UnlockSurface(surface);
    }
    return image;
}

} // namespace

Image RenderTrack(const track::RaceTrack& track, int width, int height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("RenderTrack requires a positive canvas size");
    }

    std::unique_ptr<SDL_Surface, SurfaceDeleter> surface{
        SDL_CreateRGBSurfaceWithFormat(0, width, height, 32, SDL_PIXELFORMAT_ARGB8888)};
    if (!surface) {
        throw std::runtime_error(std::string("Failed to create track surface: ") + SDL_GetError());
    }
    std::unique_ptr<SDL_Renderer, RendererDeleter> renderer{SDL_CreateSoftwareRenderer(surface.get())};
    if (!renderer) {
        throw std::runtime_error(std::string("Failed to create software renderer: ") + SDL_GetError());
    }
    SDL_SetRenderDrawBlendMode(renderer.get(), SDL_BLENDMODE_NONE);

    SetDrawColor(renderer.get(), kBackgroundColor);
    SDL_RenderClear(renderer.get());

    const float cellW = static_cast<float>(width) / static_cast<float>(track.cols());
    const float cellH = static_cast<float>(height) / static_cast<float>(track.rows());
    for (int row = 0; row < track.rows(); ++row) {
        for (int col = 0; col < track.cols(); ++col) {
            drawCell(renderer.get(), track, track::Cell{row, col}, cellW, cellH);
        }
    }
    SDL_RenderFlush(renderer.get());

    return copyPixels(surface.get());
}

Image RenderTrack(const track::RaceTrack& track) {
    return RenderTrack(track, track.canvasSize().width, track.canvasSize().height);
}

} // namespace racetrack::rendering
