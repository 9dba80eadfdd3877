#include "racetrack/track/TrackFile.h"

#include "racetrack/track/Errors.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace racetrack::track {

namespace {

constexpr char kMagic[4] = {'R', 'T', 'R', 'K'};

template <typename T>
void writeValue(std::ostream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

template <typename T>
bool readValue(std::istream& in, T& value) {
    in.read(reinterpret_cast<char*>(&value), sizeof(T));
    return static_cast<bool>(in);
}

template <typename Stored, typename T>
void writeLayer(std::ostream& out, const Layer<T>& layer) {
    for (const T& value : layer.data()) {
        writeValue(out, static_cast<Stored>(value));
    }
}

template <typename Stored, typename T>
Layer<T> readLayer(std::istream& in, int rows, int cols, const char* name) {
    Layer<T> layer{rows, cols};
    for (int row = 0; row < rows; ++row) {
        for (int col = 0; col < cols; ++col) {
            Stored value{};
            if (!readValue(in, value)) {
                throw PersistenceError(std::string("Track record truncated in ") + name + " layer");
            }
            layer.at(row, col) = static_cast<T>(value);
        }
    }
    return layer;
}

void writeCell(std::ostream& out, Cell cell) {
    writeValue(out, static_cast<std::int32_t>(cell.row));
    writeValue(out, static_cast<std::int32_t>(cell.col));
}

Cell readCell(std::istream& in, const char* name) {
    std::int32_t row = 0;
    std::int32_t col = 0;
    if (!readValue(in, row) || !readValue(in, col)) {
        throw PersistenceError(std::string("Track record truncated at ") + name);
    }
    return Cell{static_cast<int>(row), static_cast<int>(col)};
}

} // namespace

void WriteTrack(std::ostream& out, const RaceTrack& track) {
    if (track.rows() <= 0 || track.cols() <= 0 || track.rows() > kMaxGridDimension || track.cols() > kMaxGridDimension) {
        throw PersistenceError("Cannot write track with shape " + std::to_string(track.rows()) + "x"
                               + std::to_string(track.cols()));
    }
    out.write(kMagic, sizeof(kMagic));
    writeValue(out, kTrackFileVersion);
    writeValue(out, static_cast<std::int32_t>(track.rows()));
    writeValue(out, static_cast<std::int32_t>(track.cols()));
    writeLayer<std::int32_t>(out, track.walls());
    writeLayer<std::uint8_t>(out, track.active());
    writeLayer<std::uint8_t>(out, track.buttons());
    writeLayer<std::int32_t>(out, track.colors());
    writeCell(out, track.target());
    writeCell(out, track.spawn());
    writeValue(out, static_cast<std::int32_t>(track.canvasSize().width));
    writeValue(out, static_cast<std::int32_t>(track.canvasSize().height));
    if (!out) {
        throw PersistenceError("Failed to write track record");
    }
}

RaceTrack ReadTrack(std::istream& in) {
    char magic[4]{};
    in.read(magic, sizeof(magic));
    if (!in || !std::equal(magic, magic + 4, kMagic)) {
        throw PersistenceError("Not a track record (bad magic)");
    }
    std::uint16_t version = 0;
    if (!readValue(in, version)) {
        throw PersistenceError("Track record truncated at version");
    }
    if (version != kTrackFileVersion) {
        throw PersistenceError("Unsupported track record version " + std::to_string(version));
    }
    std::int32_t rows = 0;
    std::int32_t cols = 0;
    if (!readValue(in, rows) || !readValue(in, cols)) {
        throw PersistenceError("Track record truncated at shape");
    }
    if (rows <= 0 || cols <= 0 || rows > kMaxGridDimension || cols > kMaxGridDimension) {
        throw PersistenceError("Track record has invalid shape " + std::to_string(rows) + "x" + std::to_string(cols));
    }

    auto walls = readLayer<std::int32_t, int>(in, rows, cols, "walls");
    auto active = readLayer<std::uint8_t, std::uint8_t>(in, rows, cols, "active");
    auto buttons = readLayer<std::uint8_t, std::uint8_t>(in, rows, cols, "buttons");
    auto colors = readLayer<std::int32_t, int>(in, rows, cols, "colors");
    const Cell target = readCell(in, "target");
    const Cell spawn = readCell(in, "spawn");
    std::int32_t width = 0;
    std::int32_t height = 0;
    if (!readValue(in, width) || !readValue(in, height)) {
        throw PersistenceError("Track record truncated at canvas size");
    }

    try {
        return RaceTrack{std::move(walls),
                         std::move(active),
                         std::move(buttons),
                         std::move(colors),
                         target,
                         spawn,
                         CanvasSize{static_cast<int>(width), static_cast<int>(height)}};
    } catch (const std::logic_error& error) {
        throw PersistenceError(std::string("Track record is inconsistent: ") + error.what());
    }
}

void SaveTrack(const RaceTrack& track, const std::filesystem::path& path) {
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw PersistenceError("Cannot create directory " + parent.string() + ": " + ec.message());
        }
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw PersistenceError("Cannot open " + path.string() + " for writing");
    }
    WriteTrack(out, track);
    out.close();
    if (!out) {
        throw PersistenceError("Failed to flush " + path.string());
    }
    spdlog::debug("Wrote {}x{} track to {}", track.rows(), track.cols(), path.string());
}

RaceTrack LoadTrack(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw PersistenceError("Cannot open track file " + path.string());
    }
    try {
        return ReadTrack(in);
    } catch (const PersistenceError& error) {
        throw PersistenceError(path.string() + ": " + error.what());
    }
}

} // namespace racetrack::track
