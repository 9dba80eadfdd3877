#pragma once

#include "racetrack/rendering/Palette.h"

#include <SDL.h>

#include <vector>

namespace racetrack::rendering {

void SetDrawColor(SDL_Renderer* renderer, Color color);

// Rectangle whose edges are snapped to whole pixels, covering
// [x, x + width] x [y, y + height] inclusive of the far edge.
SDL_Rect SnapRect(float x, float y, float width, float height);

void FillRect(SDL_Renderer* renderer, const SDL_Rect& rect);
void DrawRectOutline(SDL_Renderer* renderer, const SDL_Rect& rect, int thickness);
void FillCircle(SDL_Renderer* renderer, float centerX, float centerY, float radius);

// Even-odd scanline fill sampled at pixel centres.
void FillPolygon(SDL_Renderer* renderer, const std::vector<SDL_FPoint>& points);

void DrawStarIcon(SDL_Renderer* renderer, const SDL_FRect& box);
void DrawSpawnIcon(SDL_Renderer* renderer, const SDL_FRect& box);

} // namespace racetrack::rendering
