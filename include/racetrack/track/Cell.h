#pragma once

#include <compare>

namespace racetrack::track {

// Largest row or column count a track may have; track files use the same bound.
inline constexpr int kMaxGridDimension = 4096;
// Largest canvas edge in pixels the editor will open.
inline constexpr int kMaxCanvasDimension = 16384;

struct Cell {
    int row{0};
    int col{0};

    auto operator<=>(const Cell&) const = default;
};

struct Shape {
    int rows{0};
    int cols{0};

    bool operator==(const Shape&) const = default;
};

struct CanvasSize {
    int width{0};
    int height{0};

    bool operator==(const CanvasSize&) const = default;
};

} // namespace racetrack::track
