#include "racetrack/track/RaceTrack.h"

#include "racetrack/track/Errors.h"

#include <algorithm>
#include <string>
#include <utility>

namespace racetrack::track {

namespace {

std::string describe(Shape shape) {
    return "(" + std::to_string(shape.rows) + ", " + std::to_string(shape.cols) + ")";
}

} // namespace

RaceTrack::RaceTrack(WallLayer walls,
                     FlagLayer active,
                     FlagLayer buttons,
                     ColorLayer colors,
                     Cell target,
                     Cell spawn,
                     CanvasSize canvasSize)
    : walls_{std::move(walls)},
      active_{std::move(active)},
      buttons_{std::move(buttons)},
      colors_{std::move(colors)},
      target_{target},
      spawn_{spawn},
      canvasSize_{canvasSize} {
    const Shape expected = walls_.shape();
    if (expected.rows > kMaxGridDimension || expected.cols > kMaxGridDimension) {
        throw BoundsError("RaceTrack grid " + describe(expected) + " exceeds the "
                          + std::to_string(kMaxGridDimension) + " cell limit per dimension");
    }
    if (active_.shape() != expected || buttons_.shape() != expected || colors_.shape() != expected) {
        throw ShapeMismatchError("All map layers must be same shape: walls " + describe(expected)
                                 + ", active " + describe(active_.shape())
                                 + ", buttons " + describe(buttons_.shape())
                                 + ", colors " + describe(colors_.shape()));
    }
    checkCell(target_, "target");
    checkCell(spawn_, "spawn");
    if (canvasSize_.width <= 0 || canvasSize_.height <= 0) {
        throw BoundsError("RaceTrack canvas size must be positive");
    }
}

void RaceTrack::setCanvasSize(CanvasSize canvasSize) {
    if (canvasSize.width <= 0 || canvasSize.height <= 0) {
        throw BoundsError("RaceTrack canvas size must be positive");
    }
    canvasSize_ = canvasSize;
    ++revision_;
}

std::set<Cell> RaceTrack::findWalls(std::optional<int> color, std::optional<bool> active) const {
    std::set<Cell> result;
    for (int row = 0; row < rows(); ++row) {
        for (int col = 0; col < cols(); ++col) {
            if (walls_.at(row, col) == 0) {
                continue;
            }
            if (color && colors_.at(row, col) != *color) {
                continue;
            }
            if (active && (active_.at(row, col) != 0) != *active) {
                continue;
            }
            result.insert(Cell{row, col});
        }
    }
    return result;
}

std::set<Cell> RaceTrack::findButtons(std::optional<int> color) const {
    std::set<Cell> result;
    for (int row = 0; row < rows(); ++row) {
        for (int col = 0; col < cols(); ++col) {
            if (buttons_.at(row, col) == 0) {
                continue;
            }
            if (color && colors_.at(row, col) != *color) {
                continue;
            }
            result.insert(Cell{row, col});
        }
    }
    return result;
}

std::set<Cell> RaceTrack::findTraversableCells() const {
    std::set<Cell> result;
    for (int row = 0; row < rows(); ++row) {
        for (int col = 0; col < cols(); ++col) {
            if (walls_.at(row, col) == 0 || active_.at(row, col) == 0) {
                result.insert(Cell{row, col});
            }
        }
    }
    return result;
}

void RaceTrack::toggle(int color) {
    for (const Cell& cell : findWalls(color)) {
        auto& flag = active_.at(cell);
        flag = flag != 0 ? 0 : 1;
    }
    ++revision_;
}

Cell RaceTrack::gridCoordFromPixel(float x, float y) const {
    const auto width = static_cast<float>(canvasSize_.width);
    const auto height = static_cast<float>(canvasSize_.height);
    if (x < 0.0F || y < 0.0F || x >= width || y >= height) {
        throw BoundsError("RaceTrack::gridCoordFromPixel point outside the canvas");
    }
    const float cellWidth = width / static_cast<float>(cols());
    const float cellHeight = height / static_cast<float>(rows());
    const int row = std::min(static_cast<int>(y / cellHeight), rows() - 1);
    const int col = std::min(static_cast<int>(x / cellWidth), cols() - 1);
    return Cell{row, col};
}

void RaceTrack::placeWall(Cell cell, int color, bool active) {
    checkCell(cell, "wall");
    if (color == 0) {
        walls_.at(cell) = 0;
        active_.at(cell) = 1;
    } else {
        walls_.at(cell) = 1;
        active_.at(cell) = active ? 1 : 0;
    }
    colors_.at(cell) = color;
    buttons_.at(cell) = 0;
    ++revision_;
}

void RaceTrack::placeButton(Cell cell, int color) {
    checkCell(cell, "button");
    buttons_.at(cell) = color == 0 ? 0 : 1;
    walls_.at(cell) = 0;
    colors_.at(cell) = color;
    active_.at(cell) = 1;
    ++revision_;
}

void RaceTrack::placeTarget(Cell cell) {
    checkCell(cell, "target");
    target_ = cell;
    clearCell(cell);
    ++revision_;
}

void RaceTrack::placeSpawn(Cell cell) {
    checkCell(cell, "spawn");
    spawn_ = cell;
    clearCell(cell);
    ++revision_;
}

bool RaceTrack::operator==(const RaceTrack& other) const {
    return walls_ == other.walls_
        && active_ == other.active_
        && buttons_ == other.buttons_
        && colors_ == other.colors_
        && target_ == other.target_
        && spawn_ == other.spawn_
        && canvasSize_ == other.canvasSize_;
}

void RaceTrack::checkCell(Cell cell, const char* what) const {
    if (!isInside(cell)) {
        throw BoundsError(std::string("RaceTrack ") + what + " cell (" + std::to_string(cell.row) + ", "
                          + std::to_string(cell.col) + ") outside grid " + describe(shape()));
    }
}

void RaceTrack::clearCell(Cell cell) {
    walls_.at(cell) = 0;
    buttons_.at(cell) = 0;
    colors_.at(cell) = 0;
    active_.at(cell) = 1;
}

RaceTrack BlankTrack(Shape gridSize, CanvasSize canvasSize) {
    return RaceTrack{WallLayer{gridSize.rows, gridSize.cols, 0},
                     FlagLayer{gridSize.rows, gridSize.cols, 1},
                     FlagLayer{gridSize.rows, gridSize.cols, 0},
                     ColorLayer{gridSize.rows, gridSize.cols, 0},
                     Cell{gridSize.rows - 1, gridSize.cols - 1},
                     Cell{0, 0},
                     canvasSize};
}

} // namespace racetrack::track
