#include "racetrack/editor/ToolPalette.h"

#include "racetrack/rendering/Palette.h"

#include <algorithm>
#include <cstddef>

namespace racetrack::editor {

namespace {

constexpr float kButtonSize = 30.0F;
constexpr float kSwatchOffsetX = 30.0F;
constexpr float kKindOffsetX = 100.0F;
constexpr float kTopMargin = 20.0F;
constexpr float kSpacing = 50.0F;

} // namespace

const char* BrushKindName(BrushKind kind) {
    switch (kind) {
    case BrushKind::Wall: return "wall";
    case BrushKind::Button: return "button";
    case BrushKind::Target: return "target";
    case BrushKind::Spawn: return "spawn";
    default: return "";
    }
}

ToolPalette::ToolPalette(int canvasWidth, int paletteSize) {
    const int swatches = std::clamp(paletteSize, 0, static_cast<int>(rendering::kPaletteSize));
    const float left = static_cast<float>(canvasWidth);
    colorButtons_.reserve(static_cast<std::size_t>(swatches));
    for (int i = 0; i < swatches; ++i) {
        colorButtons_.push_back(
            PaletteButton{left + kSwatchOffsetX, kTopMargin + kSpacing * static_cast<float>(i), kButtonSize, kButtonSize});
    }
    for (std::size_t k = 0; k < kBrushKinds.size(); ++k) {
        kindButtons_[k] =
            PaletteButton{left + kKindOffsetX, kTopMargin + kSpacing * static_cast<float>(k), kButtonSize, kButtonSize};
    }
}

std::optional<int> ToolPalette::hitColor(float x, float y) const {
    for (std::size_t i = 0; i < colorButtons_.size(); ++i) {
        if (colorButtons_[i].pointInside(x, y)) {
            return static_cast<int>(i);
        }
    }
    return std::nullopt;
}

std::optional<BrushKind> ToolPalette::hitKind(float x, float y) const {
    for (std::size_t k = 0; k < kindButtons_.size(); ++k) {
        if (kindButtons_[k].pointInside(x, y)) {
            return kBrushKinds[k];
        }
    }
    return std::nullopt;
}

} // namespace racetrack::editor
