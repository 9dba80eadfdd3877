#pragma once

#include "racetrack/rendering/Image.h"
#include "racetrack/track/RaceTrack.h"

namespace racetrack::rendering {

// Draws the track into a width x height image. The result depends only on the
// track's fields and the requested size.
Image RenderTrack(const track::RaceTrack& track, int width, int height);

// Renders at the canvas size stored in the track.
Image RenderTrack(const track::RaceTrack& track);

} // namespace racetrack::rendering
