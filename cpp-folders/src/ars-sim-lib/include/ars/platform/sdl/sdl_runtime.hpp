#pragma once

/*
    ARS SIM LIB

    FILE: sdl_runtime.hpp
    MODULE: platform
    PURPOSE: SDL2 window, keyboard -> gameplay intents, and RGBA canvas presentation.
*/


#include <cstdint>
#include <cstring>
#include <string>

#include <SDL2/SDL.h>

#include "ars/camera/view_presets.hpp"
#include "ars/core/log.hpp"
#include "ars/input/input_latch.hpp"
#include "ars/platform/platform_runtime.hpp"

namespace ars
{
    class SdlRuntime final : public IPlatformRuntime
    {
    public:
        SdlRuntime(const WindowDesc& win, const SurfaceDesc& surface)
        {
            if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0)
            {
                log_error(std::string("SDL_Init failed: ") + SDL_GetError());
                return;
            }

            window_ = SDL_CreateWindow(
                win.title.c_str(),
                SDL_WINDOWPOS_CENTERED,
                SDL_WINDOWPOS_CENTERED,
                win.width,
                win.height,
                SDL_WINDOW_SHOWN
            );
            if (!window_)
            {
                log_error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
                return;
            }

            renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
            if (!renderer_)
            {
                log_error(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
                return;
            }

            texture_ = SDL_CreateTexture(
                renderer_,
                SDL_PIXELFORMAT_RGBA32,
                SDL_TEXTUREACCESS_STREAMING,
                surface.width,
                surface.height
            );
            if (!texture_)
            {
                log_error(std::string("SDL_CreateTexture failed: ") + SDL_GetError());
                return;
            }

            valid_ = true;
        }

        ~SdlRuntime() override
        {
            if (texture_) SDL_DestroyTexture(texture_);
            if (renderer_) SDL_DestroyRenderer(renderer_);
            if (window_) SDL_DestroyWindow(window_);
            SDL_Quit();
        }

        SdlRuntime(const SdlRuntime&) = delete;
        SdlRuntime& operator=(const SdlRuntime&) = delete;

        bool valid() const override { return valid_; }

        bool pump_input(PlatformInputState& out) override
        {
            out = PlatformInputState{};

            SDL_Event e;
            while (SDL_PollEvent(&e))
            {
                if (e.type == SDL_QUIT) out.quit = true;
                if (e.type == SDL_KEYDOWN && e.key.keysym.sym == SDLK_ESCAPE) out.quit = true;
                if (e.type == SDL_KEYDOWN && e.key.keysym.sym == SDLK_p && e.key.repeat == 0) out.toggle_pause = true;

                if (e.type == SDL_KEYDOWN && e.key.repeat == 0) translate_key(e.key.keysym.sym, true, out);
                if (e.type == SDL_KEYUP) translate_key(e.key.keysym.sym, false, out);

                // Releasing everything on focus loss keeps the latch from sticking.
                if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_FOCUS_LOST)
                {
                    append_move_event(out.events, MoveDirection::Left, false);
                    append_move_event(out.events, MoveDirection::Up, false);
                    out.events.push_back(make_fire_event(false));
                }
            }
            return !out.quit;
        }

        uint64_t ticks_ms() const override
        {
            return (uint64_t)SDL_GetTicks64();
        }

        void set_title(const std::string& title) override
        {
            if (window_) SDL_SetWindowTitle(window_, title.c_str());
        }

        SDL_Window* window() const { return window_; }

        void upload_rgba8(const uint8_t* src, int width, int height, int src_pitch_bytes) override
        {
            if (!texture_ || !src) return;
            void* dst = nullptr;
            int dst_pitch = 0;
            if (SDL_LockTexture(texture_, nullptr, &dst, &dst_pitch) != 0) return;

            const int copy_bytes = width * 4;
            auto* d = static_cast<uint8_t*>(dst);
            for (int y = 0; y < height; ++y)
            {
                std::memcpy(d + y * dst_pitch, src + y * src_pitch_bytes, (size_t)copy_bytes);
            }
            SDL_UnlockTexture(texture_);
        }

        void present() override
        {
            if (!renderer_ || !texture_) return;
            SDL_SetRenderDrawColor(renderer_, 0, 0, 0, 255);
            SDL_RenderClear(renderer_);
            SDL_RenderCopy(renderer_, texture_, nullptr, nullptr);
            SDL_RenderPresent(renderer_);
        }

    private:
        static void translate_key(SDL_Keycode key, bool down, PlatformInputState& out)
        {
            switch (key)
            {
                case SDLK_LEFT:
                case SDLK_a:
                    append_move_event(out.events, MoveDirection::Left, down);
                    return;
                case SDLK_RIGHT:
                case SDLK_d:
                    append_move_event(out.events, MoveDirection::Right, down);
                    return;
                case SDLK_UP:
                case SDLK_w:
                    append_move_event(out.events, MoveDirection::Up, down);
                    return;
                case SDLK_DOWN:
                case SDLK_s:
                    append_move_event(out.events, MoveDirection::Down, down);
                    return;
                case SDLK_SPACE:
                    out.events.push_back(make_fire_event(down));
                    return;
                default:
                    break;
            }

            if (!down) return;

            if (key >= SDLK_1 && key <= SDLK_6)
            {
                const Result<ViewId> view = view_from_slot((int)(key - SDLK_1) + 1);
                if (view) out.events.push_back(make_select_view_event(view.value));
                return;
            }

            switch (key)
            {
                case SDLK_r:
                    out.events.push_back(make_command_event(InputEventType::Reset));
                    break;
                case SDLK_F1:
                    out.events.push_back(make_command_event(InputEventType::ToggleShield));
                    break;
                case SDLK_F2:
                    out.events.push_back(make_command_event(InputEventType::ToggleRapidFire));
                    break;
                default:
                    break;
            }
        }

        bool valid_ = false;
        SDL_Window* window_ = nullptr;
        SDL_Renderer* renderer_ = nullptr;
        SDL_Texture* texture_ = nullptr;
    };
}
