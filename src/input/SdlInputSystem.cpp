#include "racetrack/input/InputSystem.h"

#include <SDL.h>

#include <stdexcept>
#include <string>

namespace racetrack::input {

namespace {

class SdlInputSystem final : public IInputSystem {
public:
    void initialize() override {
        if ((SDL_WasInit(SDL_INIT_EVENTS) & SDL_INIT_EVENTS) == 0) {
            if (SDL_InitSubSystem(SDL_INIT_EVENTS) != 0) {
                throw std::runtime_error(std::string("Failed to init SDL events: ") + SDL_GetError());
            }
        }
    }

    void poll() override {
        state_.pointerPressed = false;
        state_.pointerReleased = false;
        state_.brushGrow = false;
        state_.brushShrink = false;
        state_.saveRequested = false;
        SDL_Event event{};

        while (SDL_PollEvent(&event)) {
            if (event.type == SDL_QUIT) {
                quit_ = true;
            } else if (event.type == SDL_KEYDOWN && event.key.keysym.sym == SDLK_ESCAPE) {
                quit_ = true;
            } else if (event.type == SDL_KEYDOWN) {
                switch (event.key.keysym.sym) {
                case SDLK_UP: state_.brushGrow = true; break;
                case SDLK_DOWN: state_.brushShrink = true; break;
                case SDLK_RETURN:
                case SDLK_KP_ENTER:
                    state_.saveRequested = true;
                    break;
                default: break;
                }
            } else if (event.type == SDL_MOUSEBUTTONDOWN) {
                state_.pointerPressed = true;
            } else if (event.type == SDL_MOUSEBUTTONUP) {
                state_.pointerReleased = true;
            }
        }

        const Uint8* keyboard = SDL_GetKeyboardState(nullptr);
        state_.placeInactive = keyboard[SDL_SCANCODE_A] != 0;
        SDL_GetMouseState(&state_.mouseX, &state_.mouseY);
    }

    bool shouldQuit() const override { return quit_; }
    const InputState& state() const override { return state_; }

    void shutdown() override {
        SDL_QuitSubSystem(SDL_INIT_EVENTS);
    }

private:
    InputState state_{};
    bool quit_{false};
};

} // namespace

std::unique_ptr<IInputSystem> CreateSdlInputSystem() {
    return std::make_unique<SdlInputSystem>();
}

} // namespace racetrack::input
