#include "racetrack/editor/EditorSession.h"

#include "racetrack/rendering/TrackRenderer.h"
#include "racetrack/track/TrackFile.h"

#include <spdlog/spdlog.h>

namespace racetrack::editor {

track::RaceTrack OpenStartingTrack(const core::AppConfig& config) {
    if (config.startingTrackPath) {
        track::RaceTrack loaded = track::LoadTrack(*config.startingTrackPath);
        spdlog::info("Loaded {}x{} track from {}", loaded.rows(), loaded.cols(), config.startingTrackPath->string());
        return loaded;
    }
    return track::BlankTrack(track::Shape{config.gridRows, config.gridCols},
                             track::CanvasSize{config.canvasWidth, config.canvasHeight});
}

EditorSession::EditorSession(const core::AppConfig& config)
    : config_{config},
      editor_{OpenStartingTrack(config), config.saveTrackPath, config.paletteSize},
      inputSystem_{input::CreateSdlInputSystem()} {
    // A loaded track keeps the canvas it was drawn on.
    config_.canvasWidth = editor_.track().canvasSize().width;
    config_.canvasHeight = editor_.track().canvasSize().height;
    config_.gridRows = editor_.track().rows();
    config_.gridCols = editor_.track().cols();
    presenter_ = rendering::CreateSdlPresenter(config_);
}

void EditorSession::initialize() {
    presenter_->initialize();
    inputSystem_->initialize();
    render();
}

bool EditorSession::tick() {
    handleInput();
    render();
    return !inputSystem_->shouldQuit();
}

void EditorSession::shutdown() {
    inputSystem_->shutdown();
    presenter_->shutdown();
}

void EditorSession::handleInput() {
    inputSystem_->poll();
    editor_.handleInput(inputSystem_->state());
}

void EditorSession::render() {
    const auto revision = editor_.track().revision();
    if (!renderedRevision_ || *renderedRevision_ != revision) {
        frame_ = rendering::RenderTrack(editor_.track());
        renderedRevision_ = revision;
    }
    editor_.fillHud(sidebar_);
    presenter_->present(frame_, sidebar_);
}

} // namespace racetrack::editor
