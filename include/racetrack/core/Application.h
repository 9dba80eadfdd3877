#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace racetrack::core {

struct AppConfig {
    std::string windowTitle{"Race Track Editor"};
    int canvasWidth{600};
    int canvasHeight{900};
    int gridRows{15};
    int gridCols{10};
    int paletteSize{8};
    int sidebarWidth{170};
    int targetFps{60};
    std::optional<std::filesystem::path> startingTrackPath{};
    std::filesystem::path saveTrackPath{"tracks/your_map.rtrk"};
    std::optional<std::filesystem::path> logFile{};
};

// Canvas height that keeps cells square for the configured grid.
int SquareCellCanvasHeight(int canvasWidth, int gridRows, int gridCols);

class Application {
public:
    explicit Application(AppConfig config);
    ~Application();

    void run();

private:
    void init();
    void shutdown();

    AppConfig config_{};
    bool running_{false};
};

} // namespace racetrack::core
