#pragma once

#include "racetrack/track/RaceTrack.h"

#include <cstdint>
#include <filesystem>
#include <iosfwd>

namespace racetrack::track {

inline constexpr std::uint16_t kTrackFileVersion = 1;

// Binary track record: magic "RTRK", format version, shape, the four layers,
// target, spawn and canvas size. All failures throw PersistenceError.
void WriteTrack(std::ostream& out, const RaceTrack& track);
RaceTrack ReadTrack(std::istream& in);

void SaveTrack(const RaceTrack& track, const std::filesystem::path& path);
RaceTrack LoadTrack(const std::filesystem::path& path);

} // namespace racetrack::track
