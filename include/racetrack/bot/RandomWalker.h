#pragma once

#include "racetrack/track/Cell.h"
#include "racetrack/track/RaceTrack.h"

#include <array>
#include <cstdint>
#include <optional>
#include <random>

namespace racetrack::bot {

enum class Direction : std::uint8_t {
    Up,
    Down,
    Left,
    Right
};

inline constexpr std::array<Direction, 4> kDirections{Direction::Up, Direction::Down, Direction::Left, Direction::Right};

track::Cell Step(track::Cell from, Direction direction);

// Uniformly random direction whose neighbour is currently traversable, or
// nullopt when the bot is boxed in.
std::optional<Direction> RandomMove(track::Cell location, const track::RaceTrack& track, std::mt19937& rng);

} // namespace racetrack::bot
