#include "platform/sdl_context.h"

#include "core/logger.h"

#include <algorithm>
#include <string>

namespace duelnet::platform {
namespace {

std::string SdlError() {
    const char* error = SDL_GetError();
    return error == nullptr ? std::string("unknown error") : std::string(error);
}

bool IsQuitEvent(Uint32 event_type) {
    return event_type == SDL_EVENT_QUIT ||
        event_type == SDL_EVENT_WINDOW_CLOSE_REQUESTED;
}

struct RgbaColor final {
    Uint8 r = 0;
    Uint8 g = 0;
    Uint8 b = 0;
    Uint8 a = 255;
};

constexpr RgbaColor kBackgroundColor{.r = 28, .g = 34, .b = 44, .a = 255};
constexpr RgbaColor kLocalPlayerColor{.r = 72, .g = 196, .b = 248, .a = 255};
constexpr RgbaColor kOpponentColor{.r = 236, .g = 104, .b = 86, .a = 255};
constexpr RgbaColor kShadowColor{.r = 0, .g = 0, .b = 0, .a = 96};
constexpr RgbaColor kHealthColor{.r = 214, .g = 52, .b = 64, .a = 255};
constexpr RgbaColor kManaColor{.r = 64, .g = 112, .b = 228, .a = 255};
constexpr RgbaColor kStrengthColor{.r = 228, .g = 184, .b = 72, .a = 255};
constexpr RgbaColor kHudPanelColor{.r = 18, .g = 18, .b = 22, .a = 214};
constexpr RgbaColor kBarTrackColor{.r = 54, .g = 58, .b = 64, .a = 255};

void DrawFilledRect(
    SDL_Renderer* renderer,
    float x,
    float y,
    float width,
    float height,
    const RgbaColor& color) {
    if (renderer == nullptr || width <= 0.0F || height <= 0.0F) {
        return;
    }

    (void)SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
    const SDL_FRect rect{x, y, width, height};
    (void)SDL_RenderFillRect(renderer, &rect);
}

void DrawActor(SDL_Renderer* renderer, const RenderActor& actor, const RgbaColor& color) {
    if (!actor.visible) {
        return;
    }

    if (actor.jump_offset > 0.0F) {
        DrawFilledRect(
            renderer,
            actor.x + 4.0F,
            actor.y + actor.height - 6.0F,
            actor.width - 8.0F,
            6.0F,
            kShadowColor);
    }
    DrawFilledRect(
        renderer,
        actor.x,
        actor.y - actor.jump_offset,
        actor.width,
        actor.height,
        color);
}

void DrawStatBar(
    SDL_Renderer* renderer,
    float x,
    float y,
    int value,
    int max_value,
    const RgbaColor& color) {
    constexpr float kBarWidth = 120.0F;
    constexpr float kBarHeight = 10.0F;
    DrawFilledRect(renderer, x, y, kBarWidth, kBarHeight, kBarTrackColor);
    if (max_value <= 0) {
        return;
    }

    const float fill = std::clamp(
        static_cast<float>(value) / static_cast<float>(max_value), 0.0F, 1.0F);
    DrawFilledRect(renderer, x, y, kBarWidth * fill, kBarHeight, color);
}

}  // namespace

SdlContext::~SdlContext() {
    Shutdown();
}

bool SdlContext::Initialize(const core::ClientConfig& config) {
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        core::Logger::Error("platform", "SDL_Init failed: " + SdlError());
        return false;
    }

    window_title_ = config.window_title;
    window_ = SDL_CreateWindow(
        window_title_.c_str(),
        config.window_width,
        config.window_height,
        SDL_WINDOW_RESIZABLE);
    if (window_ == nullptr) {
        core::Logger::Error("platform", "SDL_CreateWindow failed: " + SdlError());
        SDL_Quit();
        return false;
    }

    renderer_ = SDL_CreateRenderer(window_, nullptr);
    if (renderer_ == nullptr) {
        core::Logger::Error("platform", "SDL_CreateRenderer failed: " + SdlError());
        SDL_DestroyWindow(window_);
        window_ = nullptr;
        SDL_Quit();
        return false;
    }

    const int vsync = config.vsync ? 1 : 0;
    (void)SDL_SetRenderVSync(renderer_, vsync);
    (void)SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);
    // Game coordinates stay in the fixed play area whatever the window size.
    (void)SDL_SetRenderLogicalPresentation(
        renderer_,
        config.window_width,
        config.window_height,
        SDL_LOGICAL_PRESENTATION_LETTERBOX);

    core::Logger::Info("platform", "SDL3 context initialized.");
    return true;
}

bool SdlContext::PumpEvents(bool& quit_requested, InputActions& out_actions) {
    SDL_Event event{};
    while (SDL_PollEvent(&event)) {
        if (IsQuitEvent(event.type)) {
            quit_requested = true;
        }

        if (event.type == SDL_EVENT_KEY_DOWN && !event.key.repeat) {
            if (event.key.scancode == SDL_SCANCODE_SPACE) {
                out_actions.jump_pressed = true;
            }

            if (event.key.scancode == SDL_SCANCODE_ESCAPE) {
                quit_requested = true;
            }
        }
    }

    const bool* keyboard_state = SDL_GetKeyboardState(nullptr);
    if (keyboard_state != nullptr) {
        out_actions.move_left = keyboard_state[SDL_SCANCODE_A] || keyboard_state[SDL_SCANCODE_LEFT];
        out_actions.move_right =
            keyboard_state[SDL_SCANCODE_D] || keyboard_state[SDL_SCANCODE_RIGHT];
        out_actions.move_up = keyboard_state[SDL_SCANCODE_W] || keyboard_state[SDL_SCANCODE_UP];
        out_actions.move_down = keyboard_state[SDL_SCANCODE_S] || keyboard_state[SDL_SCANCODE_DOWN];
    }

    return true;
}

void SdlContext::RenderFrame(const RenderScene& scene) {
    if (renderer_ == nullptr) {
        return;
    }

    if (window_ != nullptr && scene.title_suffix != applied_title_suffix_) {
        applied_title_suffix_ = scene.title_suffix;
        const std::string title = applied_title_suffix_.empty()
            ? window_title_
            : window_title_ + " - " + applied_title_suffix_;
        (void)SDL_SetWindowTitle(window_, title.c_str());
    }

    (void)SDL_SetRenderDrawColor(
        renderer_,
        kBackgroundColor.r,
        kBackgroundColor.g,
        kBackgroundColor.b,
        kBackgroundColor.a);
    (void)SDL_RenderClear(renderer_);

    DrawActor(
        renderer_,
        scene.potion,
        scene.potion_kind == RenderPotionKind::Mana ? kManaColor : kHealthColor);
    DrawActor(renderer_, scene.opponent, kOpponentColor);
    DrawActor(renderer_, scene.local_player, kLocalPlayerColor);

    const float hud_x = 8.0F;
    const float hud_y = 8.0F;
    DrawFilledRect(renderer_, hud_x, hud_y, 136.0F, 52.0F, kHudPanelColor);
    DrawStatBar(renderer_, hud_x + 8.0F, hud_y + 8.0F, scene.hud.hp, scene.hud.hp_max, kHealthColor);
    DrawStatBar(renderer_, hud_x + 8.0F, hud_y + 22.0F, scene.hud.mp, scene.hud.mp_max, kManaColor);
    DrawStatBar(
        renderer_,
        hud_x + 8.0F,
        hud_y + 36.0F,
        scene.hud.str,
        scene.hud.str_max,
        kStrengthColor);

    if (scene.hud.link_degraded) {
        DrawFilledRect(
            renderer_,
            hud_x + 140.0F,
            hud_y,
            12.0F,
            12.0F,
            RgbaColor{.r = 240, .g = 196, .b = 64, .a = 255});
    }

    SDL_RenderPresent(renderer_);
}

void SdlContext::Shutdown() {
    if (renderer_ != nullptr) {
        SDL_DestroyRenderer(renderer_);
        renderer_ = nullptr;
    }

    if (window_ != nullptr) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }

    if (SDL_WasInit(SDL_INIT_VIDEO | SDL_INIT_EVENTS) != 0) {
        SDL_Quit();
    }
}

}  // namespace duelnet::platform
