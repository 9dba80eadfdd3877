#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace racetrack::rendering {

struct Color {
    std::uint8_t r{0};
    std::uint8_t g{0};
    std::uint8_t b{0};
    std::uint8_t a{255};

    bool operator==(const Color&) const = default;
};

inline constexpr std::size_t kPaletteSize = 8;

// Shared by wall and button colors. Index 0 is the "no color" white.
inline constexpr std::array<Color, kPaletteSize> kPalette{{
    {0xFF, 0xFF, 0xFF, 0xFF}, // white
    {0x00, 0x00, 0x00, 0xFF}, // black
    {0xD2, 0x00, 0x00, 0xFF}, // red
    {0xDE, 0x9F, 0x00, 0xFF}, // orange
    {0x00, 0xAE, 0x00, 0xFF}, // green
    {0x00, 0x00, 0xCD, 0xFF}, // blue
    {0x8B, 0x00, 0x8B, 0xFF}, // magenta
    {0x73, 0x9F, 0x9F, 0xFF}, // gray
}};

inline constexpr Color kGridLineColor{0x00, 0x00, 0x00, 0xFF};
inline constexpr Color kBackgroundColor{0xFF, 0xFF, 0xFF, 0xFF};
inline constexpr Color kSpawnColor{0x27, 0x8B, 0x00, 0xFF};
inline constexpr Color kTargetColor{0xFF, 0xC8, 0x00, 0xFF};
inline constexpr Color kSidebarColor{0xA6, 0xA6, 0xA6, 0xFF};
inline constexpr Color kButtonIconColor{0xA4, 0xA4, 0xA4, 0xFF};

inline Color PaletteColor(int index) {
    if (index < 0 || static_cast<std::size_t>(index) >= kPalette.size()) {
        return kPalette[0];
    }
    return kPalette[static_cast<std::size_t>(index)];
}

inline constexpr std::uint32_t ToArgb(Color color) {
    return (static_cast<std::uint32_t>(color.a) << 24U)
        | (static_cast<std::uint32_t>(color.r) << 16U)
        | (static_cast<std::uint32_t>(color.g) << 8U)
        | static_cast<std::uint32_t>(color.b);
}

} // namespace racetrack::rendering
