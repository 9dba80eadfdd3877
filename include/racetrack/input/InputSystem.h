#pragma once

#include <memory>

namespace racetrack::input {

struct InputState {
    int mouseX{0};
    int mouseY{0};
    bool pointerPressed{false};
    bool pointerReleased{false};
    bool brushGrow{false};
    bool brushShrink{false};
    bool saveRequested{false};
    bool placeInactive{false};
};

class IInputSystem {
public:
    virtual ~IInputSystem() = default;
    virtual void initialize() = 0;
    virtual void poll() = 0;
    virtual bool shouldQuit() const = 0;
    virtual const InputState& state() const = 0;
    virtual void shutdown() = 0;
};

std::unique_ptr<IInputSystem> CreateSdlInputSystem();

} // namespace racetrack::input
