#include "racetrack/core/Application.h"

#include "racetrack/editor/EditorSession.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>
#include <utility>

namespace racetrack::core {

int SquareCellCanvasHeight(int canvasWidth, int gridRows, int gridCols) {
    if (gridCols <= 0) {
        return canvasWidth;
    }
    return static_cast<int>(std::lround(static_cast<double>(canvasWidth) * gridRows / gridCols));
}

Application::Application(AppConfig config)
    : config_{std::move(config)} {}

Application::~Application() = default;

void Application::init() {
    running_ = true;
    spdlog::info("Starting {} ({}x{} grid, {}x{} canvas)",
                 config_.windowTitle,
                 config_.gridRows,
                 config_.gridCols,
                 config_.canvasWidth,
                 config_.canvasHeight);
}

void Application::shutdown() {
    running_ = false;
    spdlog::info("Editor closed");
}

void Application::run() {
    init();

    editor::EditorSession session{config_};
    session.initialize();

    const auto frameTime = std::chrono::milliseconds(1000 / std::max(1, config_.targetFps));
    while (running_ && session.tick()) {
        std::this_thread::sleep_for(frameTime);
    }

    session.shutdown();
    shutdown();
}

} // namespace racetrack::core
