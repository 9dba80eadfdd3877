#pragma once

#include "racetrack/core/Application.h"
#include "racetrack/editor/TrackEditor.h"
#include "racetrack/input/InputSystem.h"
#include "racetrack/rendering/Image.h"
#include "racetrack/rendering/Presenter.h"
#include "racetrack/rendering/SidebarHud.h"

#include <cstdint>
#include <memory>
#include <optional>

namespace racetrack::editor {

// Starting track for a session: the configured file when there is one,
// otherwise a blank grid at the configured size.
track::RaceTrack OpenStartingTrack(const core::AppConfig& config);

class EditorSession {
public:
    explicit EditorSession(const core::AppConfig& config);

    void initialize();
    bool tick();
    void shutdown();

private:
    void handleInput();
    void render();

    core::AppConfig config_;
    TrackEditor editor_;
    std::unique_ptr<rendering::ITrackPresenter> presenter_;
    std::unique_ptr<input::IInputSystem> inputSystem_;
    rendering::Image frame_{};
    rendering::SidebarHud sidebar_{};
    std::optional<std::uint64_t> renderedRevision_{};
};

} // namespace racetrack::editor
