#pragma once

#include "racetrack/rendering/Palette.h"

#include <cstdint>
#include <vector>

namespace racetrack::rendering {

struct RectF {
    float x{0.0F};
    float y{0.0F};
    float width{0.0F};
    float height{0.0F};
};

enum class ToolIcon : std::uint8_t {
    Wall,
    Button,
    Target,
    Spawn
};

struct SwatchHud {
    RectF rect{};
    Color color{};
    bool selected{false};
};

struct ToolIconHud {
    RectF rect{};
    ToolIcon icon{ToolIcon::Wall};
    bool selected{false};
};

struct SidebarHud {
    std::vector<SwatchHud> swatches{};
    std::vector<ToolIconHud> tools{};
    int brushRadius{1};
    bool placeInactive{false};
};

} // namespace racetrack::rendering
