#pragma once

#include "racetrack/track/Cell.h"
#include "racetrack/track/Layer.h"

#include <cstdint>
#include <optional>
#include <set>

namespace racetrack::track {

using WallLayer = Layer<int>;
using FlagLayer = Layer<std::uint8_t>;
using ColorLayer = Layer<int>;

class RaceTrack {
public:
    RaceTrack(WallLayer walls,
              FlagLayer active,
              FlagLayer buttons,
              ColorLayer colors,
              Cell target,
              Cell spawn,
              CanvasSize canvasSize);

    Shape shape() const { return walls_.shape(); }
    int rows() const { return walls_.rows(); }
    int cols() const { return walls_.cols(); }

    const WallLayer& walls() const { return walls_; }
    const FlagLayer& active() const { return active_; }
    const FlagLayer& buttons() const { return buttons_; }
    const ColorLayer& colors() const { return colors_; }

    Cell target() const { return target_; }
    Cell spawn() const { return spawn_; }
    CanvasSize canvasSize() const { return canvasSize_; }
    void setCanvasSize(CanvasSize canvasSize);

    // Bumped on every mutation; renderers compare it to skip redundant work.
    std::uint64_t revision() const { return revision_; }

    bool isInside(Cell cell) const { return walls_.contains(cell.row, cell.col); }
    bool hasWall(Cell cell) const { return walls_.at(cell) != 0; }
    bool isActive(Cell cell) const { return active_.at(cell) != 0; }
    bool isButton(Cell cell) const { return buttons_.at(cell) != 0; }
    int colorAt(Cell cell) const { return colors_.at(cell); }

    std::set<Cell> findWalls(std::optional<int> color = std::nullopt,
                             std::optional<bool> active = std::nullopt) const;
    std::set<Cell> findButtons(std::optional<int> color = std::nullopt) const;
    std::set<Cell> findTraversableCells() const;

    void toggle(int color);

    // Maps a canvas pixel to the cell under it. Throws BoundsError for points
    // outside the canvas.
    Cell gridCoordFromPixel(float x, float y) const;

    // Typed edits. Each keeps a cell at most one of {wall, button}.
    void placeWall(Cell cell, int color, bool active);
    void placeButton(Cell cell, int color);
    void placeTarget(Cell cell);
    void placeSpawn(Cell cell);

    bool operator==(const RaceTrack& other) const;

private:
    void checkCell(Cell cell, const char* what) const;
    void clearCell(Cell cell);

    WallLayer walls_;
    FlagLayer active_;
    FlagLayer buttons_;
    ColorLayer colors_;
    Cell target_;
    Cell spawn_;
    CanvasSize canvasSize_;
    std::uint64_t revision_{0};
};

// All cells empty and active, spawn in the top-left corner, target in the
// bottom-right one.
RaceTrack BlankTrack(Shape gridSize, CanvasSize canvasSize);

} // namespace racetrack::track
