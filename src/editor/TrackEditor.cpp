#include "racetrack/editor/TrackEditor.h"

#include "racetrack/rendering/Palette.h"
#include "racetrack/track/Errors.h"
#include "racetrack/track/TrackFile.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <utility>

namespace racetrack::editor {

namespace {

rendering::ToolIcon iconFor(BrushKind kind) {
    switch (kind) {
    case BrushKind::Button: return rendering::ToolIcon::Button;
    case BrushKind::Target: return rendering::ToolIcon::Target;
    case BrushKind::Spawn: return rendering::ToolIcon::Spawn;
    case BrushKind::Wall:
    default: return rendering::ToolIcon::Wall;
    }
}

rendering::RectF toHudRect(const PaletteButton& button) {
    return rendering::RectF{button.x, button.y, button.width, button.height};
}

} // namespace

TrackEditor::TrackEditor(track::RaceTrack track, std::filesystem::path savePath, int paletteSize)
    : track_{std::move(track)},
      palette_{track_.canvasSize().width, paletteSize},
      savePath_{std::move(savePath)} {}

void TrackEditor::handleInput(const input::InputState& state) {
    if (state.brushGrow) {
        ++brushRadius_;
        spdlog::debug("Brush radius {}", brushRadius_);
    }
    if (state.brushShrink) {
        brushRadius_ = std::max(1, brushRadius_ - 1);
        spdlog::debug("Brush radius {}", brushRadius_);
    }
    if (state.saveRequested && !save()) {
        spdlog::warn("Track is unsaved; press Return to retry");
    }
    placeInactive_ = state.placeInactive;

    if (state.pointerPressed) {
        painting_ = true;
        const auto x = static_cast<float>(state.mouseX);
        const auto y = static_cast<float>(state.mouseY);
        if (const auto color = palette_.hitColor(x, y)) {
            selectedColor_ = *color;
        }
        if (const auto kind = palette_.hitKind(x, y)) {
            selectedKind_ = *kind;
        }
    }

    if (painting_) {
        paintAt(state.mouseX, state.mouseY, state.placeInactive);
    }

    if (state.pointerReleased) {
        endStroke();
    }
}

void TrackEditor::paintAt(int x, int y, bool placeInactive) {
    const auto canvas = track_.canvasSize();
    if (x < 0 || y < 0 || x >= canvas.width || y >= canvas.height) {
        return;
    }
    const track::Cell center = track_.gridCoordFromPixel(static_cast<float>(x), static_cast<float>(y));
    for (int row = center.row - brushRadius_ + 1; row < center.row + brushRadius_; ++row) {
        for (int col = center.col - brushRadius_ + 1; col < center.col + brushRadius_; ++col) {
            const track::Cell cell{row, col};
            if (!track_.isInside(cell) || !touched_.insert(cell).second) {
                continue;
            }
            applyEdit(cell, placeInactive);
        }
    }
}

void TrackEditor::endStroke() {
    painting_ = false;
    touched_.clear();
}

bool TrackEditor::save() const {
    try {
        track::SaveTrack(track_, savePath_);
    } catch (const track::PersistenceError& error) {
        spdlog::error("Saving track failed: {}", error.what());
        return false;
    }
    spdlog::info("Saved track to {}", savePath_.string());
    return true;
}

void TrackEditor::fillHud(rendering::SidebarHud& hud) const {
    const auto& swatches = palette_.colorButtons();
    hud.swatches.clear();
    hud.swatches.reserve(swatches.size());
    for (std::size_t i = 0; i < swatches.size(); ++i) {
        const int index = static_cast<int>(i);
        hud.swatches.push_back(
            rendering::SwatchHud{toHudRect(swatches[i]), rendering::PaletteColor(index), index == selectedColor_});
    }

    const auto& kinds = palette_.kindButtons();
    hud.tools.clear();
    for (std::size_t k = 0; k < kinds.size(); ++k) {
        hud.tools.push_back(
            rendering::ToolIconHud{toHudRect(kinds[k]), iconFor(kBrushKinds[k]), kBrushKinds[k] == selectedKind_});
    }
    hud.brushRadius = brushRadius_;
    hud.placeInactive = placeInactive_;
}

void TrackEditor::applyEdit(track::Cell cell, bool placeInactive) {
    switch (selectedKind_) {
    case BrushKind::Wall:
        track_.placeWall(cell, selectedColor_, !placeInactive);
        break;
    case BrushKind::Button:
        track_.placeButton(cell, selectedColor_);
        break;
    case BrushKind::Target:
        track_.placeTarget(cell);
        break;
    case BrushKind::Spawn:
        track_.placeSpawn(cell);
        break;
    }
}

} // namespace racetrack::editor
