#include "racetrack/core/CommandLine.h"

#include "racetrack/track/Cell.h"

#include <charconv>
#include <limits>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace racetrack::core {

namespace {

bool parsePositive(std::string_view text, int limit, int& out) {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    if (text.empty()) {
        return false;
    }
    int value = 0;
    const char* end = text.data() + text.size();
    const auto result = std::from_chars(text.data(), end, value, 10);
    if (result.ec != std::errc() || result.ptr != end || value <= 0 || value > limit) {
        return false;
    }
    out = value;
    return true;
}

bool takesValue(std::string_view name) {
    return name == "--load" || name == "--save" || name == "--rows" || name == "--cols" || name == "--width"
        || name == "--fps" || name == "--log-file";
}

} // namespace

CommandLineArgs ParseCommandLine(const std::vector<std::string_view>& argv, AppConfig defaults) {
    CommandLineArgs args{};
    args.config = std::move(defaults);
    AppConfig& config = args.config;

    for (std::size_t i = 1; i < argv.size(); ++i) {
        std::string_view arg = argv[i];
        std::string_view name = arg;
        std::optional<std::string_view> value;
        if (const auto eq = arg.find('='); arg.rfind("--", 0) == 0 && eq != std::string_view::npos) {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        }

        if (name == "--help" || name == "-h") {
            args.showHelp = true;
            continue;
        }
        if (!takesValue(name)) {
            args.unknown.emplace_back(arg);
            continue;
        }
        if (!value) {
            if (i + 1 >= argv.size()) {
                args.errors.push_back(std::string(name) + " expects a value");
                continue;
            }
            value = argv[++i];
        }

        if (name == "--load") {
            config.startingTrackPath = std::filesystem::path(std::string(*value));
        } else if (name == "--save") {
            config.saveTrackPath = std::filesystem::path(std::string(*value));
        } else if (name == "--log-file") {
            config.logFile = std::filesystem::path(std::string(*value));
        } else {
            int limit = std::numeric_limits<int>::max();
            if (name == "--rows" || name == "--cols") {
                limit = track::kMaxGridDimension;
            } else if (name == "--width") {
                limit = track::kMaxCanvasDimension;
            }
            int parsed = 0;
            if (!parsePositive(*value, limit, parsed)) {
                args.errors.push_back(std::string(name) + " expects an integer in 1.." + std::to_string(limit) + ", got '"
                                      + std::string(*value) + "'");
                continue;
            }
            if (name == "--rows") {
                config.gridRows = parsed;
            } else if (name == "--cols") {
                config.gridCols = parsed;
            } else if (name == "--width") {
                config.canvasWidth = parsed;
            } else {
                config.targetFps = parsed;
            }
        }
    }

    const double height = static_cast<double>(config.canvasWidth) * config.gridRows / config.gridCols;
    if (height > track::kMaxCanvasDimension) {
        args.errors.push_back("--width " + std::to_string(config.canvasWidth) + " with a " + std::to_string(config.gridRows)
                              + "x" + std::to_string(config.gridCols) + " grid needs a canvas taller than "
                              + std::to_string(track::kMaxCanvasDimension) + " pixels");
    } else {
        config.canvasHeight = SquareCellCanvasHeight(config.canvasWidth, config.gridRows, config.gridCols);
    }
    return args;
}

std::string Usage(std::string_view program) {
    std::string text = "usage: ";
    text += program;
    text += " [options]\n"
            "  --load PATH      start from a saved track\n"
            "  --save PATH      where Return saves the track (default tracks/your_map.rtrk)\n"
            "  --rows N         grid rows for a blank track (default 15)\n"
            "  --cols N         grid columns for a blank track (default 10)\n"
            "  --width PX       canvas width in pixels (default 600)\n"
            "  --fps N          frame rate (default 60)\n"
            "  --log-file PATH  also write the log to PATH\n"
            "  --help           show this message\n"
            "\n"
            "Editing: click a swatch or tool to select it, drag on the track to paint.\n"
            "Up/Down resize the brush, hold A to paint inactive walls, Return saves.\n";
    return text;
}

} // namespace racetrack::core
