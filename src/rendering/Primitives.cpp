#include "racetrack/rendering/Primitives.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace racetrack::rendering {

namespace {

constexpr float kPi = 3.1415926535F;
constexpr int kStarPoints = 5;
constexpr float kStarInnerRatio = 0.4F;

void fillSpan(SDL_Renderer* renderer, float left, float right, int y) {
    const int start = static_cast<int>(std::ceil(left - 0.5F));
    const int end = static_cast<int>(std::floor(right - 0.5F));
    if (end < start) {
        return;
    }
    const SDL_Rect span{start, y, end - start + 1, 1};
    SDL_RenderFillRect(renderer, &span);
}

} // namespace

void SetDrawColor(SDL_Renderer* renderer, Color color) {
    SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
}

SDL_Rect SnapRect(float x, float y, float width, float height) {
    const int left = static_cast<int>(std::floor(x));
    const int top = static_cast<int>(std::floor(y));
    const int right = static_cast<int>(std::floor(x + width)) + 1;
    const int bottom = static_cast<int>(std::floor(y + height)) + 1;
    return SDL_Rect{left, top, right - left, bottom - top};
}

void FillRect(SDL_Renderer* renderer, const SDL_Rect& rect) {
    SDL_RenderFillRect(renderer, &rect);
}

void DrawRectOutline(SDL_Renderer* renderer, const SDL_Rect& rect, int thickness) {
    const int t = std::max(1, thickness);
    if (t * 2 >= rect.w || t * 2 >= rect.h) {
        SDL_RenderFillRect(renderer, &rect);
        return;
    }
    const SDL_Rect edges[4] = {
        {rect.x, rect.y, rect.w, t},
        {rect.x, rect.y + rect.h - t, rect.w, t},
        {rect.x, rect.y + t, t, rect.h - 2 * t},
        {rect.x + rect.w - t, rect.y + t, t, rect.h - 2 * t},
    };
    SDL_RenderFillRects(renderer, edges, 4);
}

void FillCircle(SDL_Renderer* renderer, float centerX, float centerY, float radius) {
    if (radius <= 0.0F) {
        return;
    }
    const int top = static_cast<int>(std::floor(centerY - radius));
    const int bottom = static_cast<int>(std::ceil(centerY + radius));
    for (int y = top; y <= bottom; ++y) {
        const float dy = static_cast<float>(y) + 0.5F - centerY;
        if (std::abs(dy) > radius) {
            continue;
        }
        const float half = std::sqrt(radius * radius - dy * dy);
        fillSpan(renderer, centerX - half, centerX + half, y);
    }
}

void FillPolygon(SDL_Renderer* renderer, const std::vector<SDL_FPoint>& points) {
    if (points.size() < 3) {
        return;
    }
    float minY = points.front().y;
    float maxY = points.front().y;
    for (const auto& point : points) {
        minY = std::min(minY, point.y);
        maxY = std::max(maxY, point.y);
    }

    std::vector<float> crossings;
    crossings.reserve(points.size());
    const int top = static_cast<int>(std::floor(minY));
    const int bottom = static_cast<int>(std::ceil(maxY));
    for (int y = top; y < bottom; ++y) {
        const float sampleY = static_cast<float>(y) + 0.5F;
        crossings.clear();
        for (std::size_t i = 0; i < points.size(); ++i) {
            const SDL_FPoint& a = points[i];
            const SDL_FPoint& b = points[(i + 1) % points.size()];
            const bool spans = (a.y <= sampleY && sampleY < b.y) || (b.y <= sampleY && sampleY < a.y);
            if (!spans) {
                continue;
            }
            const float t = (sampleY - a.y) / (b.y - a.y);
            crossings.push_back(a.x + t * (b.x - a.x));
        }
        std::sort(crossings.begin(), crossings.end());
        for (std::size_t i = 0; i + 1 < crossings.size(); i += 2) {
            fillSpan(renderer, crossings[i], crossings[i + 1], y);
        }
    }
}

void DrawStarIcon(SDL_Renderer* renderer, const SDL_FRect& box) {
    const float centerX = box.x + box.w * 0.5F;
    const float centerY = box.y + box.h * 0.5F;
    const float outer = 0.5F * std::min(box.w, box.h);
    const float inner = outer * kStarInnerRatio;
    std::vector<SDL_FPoint> points;
    points.reserve(kStarPoints * 2);
    for (int i = 0; i < kStarPoints * 2; ++i) {
        const float radius = (i % 2 == 0) ? outer : inner;
        const float angle = -0.5F * kPi + static_cast<float>(i) * kPi / static_cast<float>(kStarPoints);
        points.push_back(SDL_FPoint{centerX + radius * std::cos(angle), centerY + radius * std::sin(angle)});
    }
    SetDrawColor(renderer, kTargetColor);
    FillPolygon(renderer, points);
}

void DrawSpawnIcon(SDL_Renderer* renderer, const SDL_FRect& box) {
    SetDrawColor(renderer, kBackgroundColor);
    const SDL_Rect backdrop{static_cast<int>(box.x), static_cast<int>(box.y), static_cast<int>(box.w), static_cast<int>(box.h)};
    SDL_RenderFillRect(renderer, &backdrop);
    SetDrawColor(renderer, kSpawnColor);
    FillPolygon(renderer, {
        SDL_FPoint{box.x + box.w * 0.5F, box.y},
        SDL_FPoint{box.x + box.w, box.y + box.h},
        SDL_FPoint{box.x, box.y + box.h},
    });
}

} // namespace racetrack::rendering
