#include "racetrack/rendering/Presenter.h"

#include "racetrack/core/Application.h"
#include "racetrack/rendering/Primitives.h"

#include <SDL.h>

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace racetrack::rendering {

namespace {

constexpr int kSelectionInflate = 10;
constexpr int kSelectionThickness = 5;
constexpr float kButtonIconRadius = 10.0F / 30.0F;
constexpr float kStarIconScale = 25.0F / 30.0F;
constexpr float kSpawnIconInset = 5.0F / 30.0F;

SDL_Rect toRect(const RectF& rect) {
    return SDL_Rect{static_cast<int>(rect.x), static_cast<int>(rect.y),
                    static_cast<int>(rect.width), static_cast<int>(rect.height)};
}

class SdlPresenter final : public ITrackPresenter {
public:
    explicit SdlPresenter(core::AppConfig config) : config_{std::move(config)} {}

    void initialize() override {
        if ((SDL_WasInit(SDL_INIT_VIDEO) & SDL_INIT_VIDEO) == 0) {
            if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS) != 0) {
                throw std::runtime_error(std::string("Failed to init SDL: ") + SDL_GetError());
            }
        }

        window_ = SDL_CreateWindow(config_.windowTitle.c_str(),
                                   SDL_WINDOWPOS_CENTERED,
                                   SDL_WINDOWPOS_CENTERED,
                                   config_.canvasWidth + config_.sidebarWidth,
                                   config_.canvasHeight,
                                   SDL_WINDOW_SHOWN);
        if (!window_) {
            throw std::runtime_error(std::string("Failed to create window: ") + SDL_GetError());
        }

        renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
        if (!renderer_) {
            SDL_DestroyWindow(window_);
            window_ = nullptr;
            throw std::runtime_error(std::string("Failed to create renderer: ") + SDL_GetError());
        }
        SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_NONE);
    }

    void present(const Image& canvas, const SidebarHud& sidebar) override {
        SetDrawColor(renderer_, kSidebarColor);
        SDL_RenderClear(renderer_);

        uploadCanvas(canvas);
        if (canvasTexture_) {
            const SDL_Rect dest{0, 0, canvas.width, canvas.height};
            SDL_RenderCopy(renderer_, canvasTexture_, nullptr, &dest);
        }

        for (const auto& swatch : sidebar.swatches) {
            drawSwatch(swatch);
        }
        for (const auto& tool : sidebar.tools) {
            drawTool(tool);
        }
        updateTitle(sidebar);

        SDL_RenderPresent(renderer_);
    }

    void shutdown() override {
        if (canvasTexture_) {
            SDL_DestroyTexture(canvasTexture_);
            canvasTexture_ = nullptr;
        }
        if (renderer_) {
            SDL_DestroyRenderer(renderer_);
            renderer_ = nullptr;
        }
        if (window_) {
            SDL_DestroyWindow(window_);
            window_ = nullptr;
        }
        SDL_QuitSubSystem(SDL_INIT_VIDEO);
    }

private:
    void uploadCanvas(const Image& canvas) {
        if (canvas.width <= 0 || canvas.height <= 0) {
            return;
        }
        if (!canvasTexture_ || textureWidth_ != canvas.width || textureHeight_ != canvas.height) {
            if (canvasTexture_) {
                SDL_DestroyTexture(canvasTexture_);
            }
            canvasTexture_ = SDL_CreateTexture(renderer_,
                                               SDL_PIXELFORMAT_ARGB8888,
                                               SDL_TEXTUREACCESS_STREAMING,
                                               canvas.width,
                                               canvas.height);
            if (!canvasTexture_) {
                throw std::runtime_error(std::string("Failed to create canvas texture: ") + SDL_GetError());
            }
            textureWidth_ = canvas.width;
            textureHeight_ = canvas.height;
        }
        if (SDL_UpdateTexture(canvasTexture_,
                              nullptr,
                              canvas.pixels.data(),
                              canvas.width * static_cast<int>(sizeof(std::uint32_t))) != 0) {
            throw std::runtime_error(std::string("Failed to upload canvas: ") + SDL_GetError());
        }
    }

    void drawSelection(const RectF& rect) {
        const SDL_Rect frame{static_cast<int>(rect.x) - kSelectionInflate,
                             static_cast<int>(rect.y) - kSelectionInflate,
                             static_cast<int>(rect.width) + 2 * kSelectionInflate,
                             static_cast<int>(rect.height) + 2 * kSelectionInflate};
        SetDrawColor(renderer_, kGridLineColor);
        DrawRectOutline(renderer_, frame, kSelectionThickness);
    }

    void drawSwatch(const SwatchHud& swatch) {
        SetDrawColor(renderer_, swatch.color);
        FillRect(renderer_, toRect(swatch.rect));
        if (swatch.selected) {
            drawSelection(swatch.rect);
        }
    }

    void drawTool(const ToolIconHud& tool) {
        const RectF& r = tool.rect;
        const SDL_Rect bounds = toRect(r);
        switch (tool.icon) {
        case ToolIcon::Wall:
            SetDrawColor(renderer_, kBackgroundColor);
            FillRect(renderer_, bounds);
            break;
        case ToolIcon::Button:
            SetDrawColor(renderer_, kGridLineColor);
            FillRect(renderer_, bounds);
            SetDrawColor(renderer_, kButtonIconColor);
            FillCircle(renderer_, r.x + r.width * 0.5F, r.y + r.height * 0.5F, kButtonIconRadius * r.width);
            break;
        case ToolIcon::Target: {
            const float size = r.width * kStarIconScale;
            DrawStarIcon(renderer_, SDL_FRect{r.x, r.y, size, size});
            break;
        }
        case ToolIcon::Spawn: {
            SetDrawColor(renderer_, kBackgroundColor);
            FillRect(renderer_, bounds);
            const float inset = r.width * kSpawnIconInset;
            DrawSpawnIcon(renderer_, SDL_FRect{r.x + inset, r.y + inset, r.width - 2.0F * inset, r.height - 2.0F * inset});
            break;
        }
        }
        if (tool.selected) {
            drawSelection(r);
        }
    }

    void updateTitle(const SidebarHud& sidebar) {
        if (sidebar.brushRadius == shownBrush_ && sidebar.placeInactive == shownInactive_) {
            return;
        }
        shownBrush_ = sidebar.brushRadius;
        shownInactive_ = sidebar.placeInactive;
        std::string title = config_.windowTitle + " - brush " + std::to_string(shownBrush_);
        if (shownInactive_) {
            title += " (inactive walls)";
        }
        SDL_SetWindowTitle(window_, title.c_str());
    }

    core::AppConfig config_;
    SDL_Window* window_{nullptr};
    SDL_Renderer* renderer_{nullptr};
    SDL_Texture* canvasTexture_{nullptr};
    int textureWidth_{0};
    int textureHeight_{0};
    int shownBrush_{0};
    bool shownInactive_{false};
};

} // namespace

std::unique_ptr<ITrackPresenter> CreateSdlPresenter(const core::AppConfig& config) {
    return std::make_unique<SdlPresenter>(config);
}

} // namespace racetrack::rendering
