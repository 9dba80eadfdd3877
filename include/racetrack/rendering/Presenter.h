#pragma once

#include "racetrack/rendering/Image.h"
#include "racetrack/rendering/SidebarHud.h"

#include <memory>

namespace racetrack::core {
struct AppConfig;
}

namespace racetrack::rendering {

class ITrackPresenter {
public:
    virtual ~ITrackPresenter() = default;
    virtual void initialize() = 0;
    virtual void present(const Image& canvas, const SidebarHud& sidebar) = 0;
    virtual void shutdown() = 0;
};

std::unique_ptr<ITrackPresenter> CreateSdlPresenter(const core::AppConfig& config);

} // namespace racetrack::rendering
