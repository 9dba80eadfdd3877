#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace racetrack::rendering {

// Row-major ARGB8888 pixels.
struct Image {
    int width{0};
    int height{0};
    std::vector<std::uint32_t> pixels{};

    std::uint32_t pixel(int x, int y) const {
        return pixels[static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)];
    }

    bool operator==(const Image&) const = default;
};

} // namespace racetrack::rendering
