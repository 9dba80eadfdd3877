#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace racetrack::editor {

enum class BrushKind : std::uint8_t {
    Wall,
    Button,
    Target,
    Spawn
};

inline constexpr std::array<BrushKind, 4> kBrushKinds{BrushKind::Wall, BrushKind::Button, BrushKind::Target, BrushKind::Spawn};

const char* BrushKindName(BrushKind kind);

struct PaletteButton {
    float x{0.0F};
    float y{0.0F};
    float width{0.0F};
    float height{0.0F};

    // Edges do not count as inside.
    bool pointInside(float px, float py) const {
        return x < px && px < x + width && y < py && py < y + height;
    }
};

// Sidebar to the right of the canvas: one swatch per palette color and one
// icon per brush kind.
class ToolPalette {
public:
    ToolPalette(int canvasWidth, int paletteSize);

    const std::vector<PaletteButton>& colorButtons() const { return colorButtons_; }
    const std::array<PaletteButton, kBrushKinds.size()>& kindButtons() const { return kindButtons_; }

    std::optional<int> hitColor(float x, float y) const;
    std::optional<BrushKind> hitKind(float x, float y) const;

private:
    std::vector<PaletteButton> colorButtons_{};
    std::array<PaletteButton, kBrushKinds.size()> kindButtons_{};
};

} // namespace racetrack::editor
