#include "racetrack/bot/RandomWalker.h"

#include <set>
#include <vector>

namespace racetrack::bot {

track::Cell Step(track::Cell from, Direction direction) {
    switch (direction) {
    case Direction::Up: return track::Cell{from.row - 1, from.col};
    case Direction::Down: return track::Cell{from.row + 1, from.col};
    case Direction::Left: return track::Cell{from.row, from.col - 1};
    case Direction::Right: return track::Cell{from.row, from.col + 1};
    default: return from;
    }
}

std::optional<Direction> RandomMove(track::Cell location, const track::RaceTrack& track, std::mt19937& rng) {
    const std::set<track::Cell> safe = track.findTraversableCells();
    std::vector<Direction> options;
    options.reserve(kDirections.size());
    for (const Direction direction : kDirections) {
        if (safe.count(Step(location, direction)) != 0) {
            options.push_back(direction);
        }
    }
    if (options.empty()) {
        return std::nullopt;
    }
    std::uniform_int_distribution<std::size_t> pick{0, options.size() - 1};
    return options[pick(rng)];
}

} // namespace racetrack::bot
