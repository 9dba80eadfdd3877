#pragma once

#include "racetrack/editor/ToolPalette.h"
#include "racetrack/input/InputSystem.h"
#include "racetrack/rendering/SidebarHud.h"
#include "racetrack/track/RaceTrack.h"

#include <filesystem>
#include <set>

namespace racetrack::editor {

class TrackEditor {
public:
    TrackEditor(track::RaceTrack track, std::filesystem::path savePath, int paletteSize);

    void handleInput(const input::InputState& state);

    // Applies the current brush around the cell under (x, y). Points outside
    // the canvas are ignored. Each cell is edited at most once per stroke.
    void paintAt(int x, int y, bool placeInactive);
    void endStroke();

    bool save() const;

    void fillHud(rendering::SidebarHud& hud) const;

    const track::RaceTrack& track() const { return track_; }
    track::RaceTrack& track() { return track_; }
    const ToolPalette& palette() const { return palette_; }
    const std::filesystem::path& savePath() const { return savePath_; }

    int selectedColor() const { return selectedColor_; }
    BrushKind selectedKind() const { return selectedKind_; }
    int brushRadius() const { return brushRadius_; }
    bool painting() const { return painting_; }

private:
    void applyEdit(track::Cell cell, bool placeInactive);

    track::RaceTrack track_;
    ToolPalette palette_;
    std::filesystem::path savePath_;
    int selectedColor_{1};
    BrushKind selectedKind_{BrushKind::Wall};
    int brushRadius_{1};
    bool painting_{false};
    bool placeInactive_{false};
    std::set<track::Cell> touched_{};
};

} // namespace racetrack::editor
