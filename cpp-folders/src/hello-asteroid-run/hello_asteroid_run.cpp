#define SDL_MAIN_HANDLED

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include <ars/app/game_session.hpp>
#include <ars/config/env_config.hpp>
#include <ars/config/game_config.hpp>
#include <ars/core/log.hpp>
#include <ars/core/time.hpp>
#include <ars/platform/sdl/sdl_runtime.hpp>
#include <ars/sim/visual_handle.hpp>

namespace
{
    constexpr int WINDOW_W = 1280;
    constexpr int WINDOW_H = 720;
    constexpr int CANVAS_W = 640;
    constexpr int CANVAS_H = 360;

    struct Rgb
    {
        uint8_t r = 0;
        uint8_t g = 0;
        uint8_t b = 0;
    };

    Rgb kind_color(ars::VisualKind kind)
    {
        switch (kind)
        {
            case ars::VisualKind::Player: return Rgb{60, 200, 255};
            case ars::VisualKind::PlayerCockpit: return Rgb{230, 240, 255};
            case ars::VisualKind::Obstacle: return Rgb{170, 130, 100};
            case ars::VisualKind::Projectile: return Rgb{255, 90, 60};
        }
        return Rgb{255, 255, 255};
    }

    struct Sprite
    {
        ars::VisualKind kind = ars::VisualKind::Player;
        glm::vec3 pos{0.0f};
        glm::vec3 scl{1.0f};
        float radius = 1.0f;
        float opacity = 1.0f;
        bool live = true;
    };

    // Keeps one sprite per attached handle; detached sprites are dropped on the next draw.
    class CanvasVisualFactory final : public ars::IVisualFactory
    {
    public:
        std::unique_ptr<ars::IVisualHandle> attach_visual(ars::VisualKind kind, const ars::VisualDesc& desc) override
        {
            auto sprite = std::make_shared<Sprite>();
            sprite->kind = kind;
            sprite->radius = default_radius(kind, desc);
            sprites_.push_back(sprite);
            return std::make_unique<Handle>(sprite);
        }

        template<typename Fn>
        void for_each_live(Fn&& fn)
        {
            sprites_.erase(
                std::remove_if(sprites_.begin(), sprites_.end(), [](const std::shared_ptr<Sprite>& s) { return !s->live; }),
                sprites_.end());
            for (const auto& s : sprites_) fn(*s);
        }

    private:
        static float default_radius(ars::VisualKind kind, const ars::VisualDesc& desc)
        {
            if (desc.radius > 0.0f) return desc.radius;
            switch (kind)
            {
                case ars::VisualKind::Player: return 1.4f;
                case ars::VisualKind::PlayerCockpit: return 0.4f;
                case ars::VisualKind::Obstacle: return desc.size > 0.0f ? desc.size : 1.0f;
                case ars::VisualKind::Projectile: return 0.2f;
            }
            return 1.0f;
        }

        struct Handle final : ars::IVisualHandle
        {
            explicit Handle(std::shared_ptr<Sprite> s) : sprite(std::move(s)) {}

            void update_transform(const glm::vec3& pos, const glm::vec3&, const glm::vec3& scl) override
            {
                sprite->pos = pos;
                sprite->scl = scl;
            }
            void set_opacity(float alpha) override { sprite->opacity = alpha; }
            void detach() override { sprite->live = false; }

            std::shared_ptr<Sprite> sprite{};
        };

        std::vector<std::shared_ptr<Sprite>> sprites_{};
    };

    // Flash plus a spray of embers per destroyed obstacle, stepped once per tick.
    class ExplosionBursts
    {
    public:
        static constexpr int kParticles = 30;
        static constexpr int kLifetimeTicks = 30;

        void spawn(const glm::vec3& pos)
        {
            Burst b{};
            b.flash_pos = pos;
            std::uniform_real_distribution<float> unit(-0.5f, 0.5f);
            std::uniform_real_distribution<float> hue(0.0f, 1.0f);
            for (int i = 0; i < kParticles; ++i)
            {
                Ember e{};
                e.pos = pos;
                e.vel = glm::vec3(unit(rng_), unit(rng_), unit(rng_));
                const float h = hue(rng_);
                e.color = Rgb{255, (uint8_t)(40 + 100 * h), 0};
                b.embers.push_back(e);
            }
            bursts_.push_back(std::move(b));
        }

        void tick()
        {
            for (Burst& b : bursts_)
            {
                ++b.age;
                b.flash_scale *= 1.1f;
                b.flash_opacity -= 0.15f;
                for (Ember& e : b.embers)
                {
                    e.pos += e.vel;
                    e.opacity -= 0.02f;
                    e.vel *= 0.98f;
                }
            }
            bursts_.erase(
                std::remove_if(bursts_.begin(), bursts_.end(), [](const Burst& b) { return b.age >= kLifetimeTicks; }),
                bursts_.end());
        }

        template<typename Fn>
        void for_each_disc(Fn&& fn) const
        {
            for (const Burst& b : bursts_)
            {
                if (b.flash_opacity > 0.0f) fn(b.flash_pos, b.flash_scale, Rgb{255, 136, 0}, b.flash_opacity);
                for (const Ember& e : b.embers)
                {
                    if (e.opacity > 0.0f) fn(e.pos, 0.2f, e.color, e.opacity);
                }
            }
        }

    private:
        struct Ember
        {
            glm::vec3 pos{0.0f};
            glm::vec3 vel{0.0f};
            Rgb color{};
            float opacity = 1.0f;
        };

        struct Burst
        {
            glm::vec3 flash_pos{0.0f};
            float flash_scale = 1.0f;
            float flash_opacity = 1.0f;
            int age = 0;
            std::vector<Ember> embers{};
        };

        std::vector<Burst> bursts_{};
        std::mt19937 rng_{0xA57u};
    };

    struct Canvas
    {
        int w = CANVAS_W;
        int h = CANVAS_H;
        std::vector<uint8_t> rgba{};

        Canvas() : rgba((size_t)CANVAS_W * (size_t)CANVAS_H * 4u, 0u) {}

        void clear(Rgb c)
        {
            for (size_t i = 0; i < rgba.size(); i += 4)
            {
                rgba[i + 0] = c.r;
                rgba[i + 1] = c.g;
                rgba[i + 2] = c.b;
                rgba[i + 3] = 255;
            }
        }

        void blend(int x, int y, Rgb c, float alpha)
        {
            if (x < 0 || y < 0 || x >= w || y >= h) return;
            uint8_t* p = &rgba[((size_t)y * (size_t)w + (size_t)x) * 4u];
            const float a = std::clamp(alpha, 0.0f, 1.0f);
            p[0] = (uint8_t)std::lround(p[0] + (c.r - p[0]) * a);
            p[1] = (uint8_t)std::lround(p[1] + (c.g - p[1]) * a);
            p[2] = (uint8_t)std::lround(p[2] + (c.b - p[2]) * a);
        }

        void fill_disc(float cx, float cy, float r, Rgb c, float alpha)
        {
            const int x0 = (int)std::floor(cx - r);
            const int x1 = (int)std::ceil(cx + r);
            const int y0 = (int)std::floor(cy - r);
            const int y1 = (int)std::ceil(cy + r);
            const float r2 = r * r;
            for (int y = std::max(0, y0); y <= std::min(h - 1, y1); ++y)
            {
                for (int x = std::max(0, x0); x <= std::min(w - 1, x1); ++x)
                {
                    const float dx = (float)x + 0.5f - cx;
                    const float dy = (float)y + 0.5f - cy;
                    if (dx * dx + dy * dy <= r2) blend(x, y, c, alpha);
                }
            }
        }
    };

    // World point -> canvas pixel; false when behind the camera.
    bool project(const ars::RenderSnapshot& snap, const glm::vec3& p, float world_radius, float& sx, float& sy, float& sr)
    {
        const glm::vec4 clip = snap.viewproj * glm::vec4(p, 1.0f);
        if (clip.w <= 1e-4f) return false;
        const glm::vec3 ndc = glm::vec3(clip) / clip.w;
        sx = (ndc.x * 0.5f + 0.5f) * (float)CANVAS_W;
        sy = (1.0f - (ndc.y * 0.5f + 0.5f)) * (float)CANVAS_H;
        sr = world_radius * snap.proj[1][1] / clip.w * 0.5f * (float)CANVAS_H;
        return true;
    }

    void draw_frame(Canvas& canvas, const ars::RenderSnapshot& snap, CanvasVisualFactory& visuals, const ExplosionBursts& bursts)
    {
        canvas.clear(snap.phase == ars::SessionPhase::GameOver ? Rgb{24, 4, 8} : Rgb{4, 6, 16});

        for (const ars::RenderItem& it : snap.items)
        {
            if (it.kind != ars::EntityKind::Star) continue;
            float sx = 0.0f, sy = 0.0f, sr = 0.0f;
            if (!project(snap, it.pos, it.radius, sx, sy, sr)) continue;
            canvas.fill_disc(sx, sy, std::max(0.6f, sr), Rgb{220, 220, 220}, 0.8f);
        }

        // Far to near so closer sprites cover farther ones.
        std::vector<const Sprite*> order{};
        visuals.for_each_live([&](const Sprite& s) { order.push_back(&s); });
        std::sort(order.begin(), order.end(), [&](const Sprite* a, const Sprite* b) {
            return glm::length(a->pos - snap.camera_pos) > glm::length(b->pos - snap.camera_pos);
        });

        for (const Sprite* s : order)
        {
            if (s->opacity <= 0.0f) continue;
            float sx = 0.0f, sy = 0.0f, sr = 0.0f;
            if (!project(snap, s->pos, s->radius * s->scl.x, sx, sy, sr)) continue;
            Rgb c = kind_color(s->kind);
            if (s->kind == ars::VisualKind::Player && snap.shield) c = Rgb{120, 255, 160};
            canvas.fill_disc(sx, sy, std::max(1.0f, sr), c, s->opacity);
        }

        bursts.for_each_disc([&](const glm::vec3& pos, float radius, Rgb c, float alpha) {
            float sx = 0.0f, sy = 0.0f, sr = 0.0f;
            if (!project(snap, pos, radius, sx, sy, sr)) return;
            canvas.fill_disc(sx, sy, std::max(1.0f, sr), c, alpha);
        });
    }

    std::string hud_title(const ars::RenderSnapshot& snap, float fps, bool paused)
    {
        std::string title = std::string("HelloAsteroidRun")
            + " | fps=" + std::to_string((int)std::lround(fps))
            + " | score=" + std::to_string(snap.score)
            + " | view=" + ars::view_name(snap.view_id)
            + " | shield=" + (snap.shield ? "on" : "off")
            + " | rapid=" + (snap.rapid_fire ? "on" : "off");
        if (snap.phase == ars::SessionPhase::GameOver) title += " | GAME OVER (R to restart)";
        else if (paused) title += " | paused";
        return title;
    }
}

int main(int argc, char* argv[])
{
    ars::GameConfig cfg{};
    ars::apply_env_overrides(cfg);
    cfg.camera.aspect = (float)CANVAS_W / (float)CANVAS_H;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i] ? argv[i] : "";
        if (arg == "--seed" && i + 1 < argc)
        {
            cfg.seed = ars::parse_env_u32(argv[++i], cfg.seed);
        }
        else if (arg == "--view" && i + 1 < argc)
        {
            const ars::Result<ars::ViewId> view = ars::parse_view_id(argv[++i]);
            if (view) cfg.camera.start_view = view.value;
            else std::fprintf(stderr, "[ars] %s\n", view.error.c_str());
        }
        else if (arg == "--shield")
        {
            cfg.player.start_shield = true;
        }
        else if (arg == "--rapid-fire")
        {
            cfg.player.start_rapid_fire = true;
        }
    }

    ars::SdlRuntime runtime{
        ars::WindowDesc{"HelloAsteroidRun", WINDOW_W, WINDOW_H},
        ars::SurfaceDesc{CANVAS_W, CANVAS_H}
    };
    if (!runtime.valid()) return 1;

    CanvasVisualFactory visuals{};
    ars::Game game(cfg, &visuals);
    ExplosionBursts bursts{};
    game.events().on_obstacle_destroyed = [&bursts](const glm::vec3& pos, ars::DestroyCause cause) {
        if (cause != ars::DestroyCause::PassedPlayer) bursts.spawn(pos);
    };
    game.events().on_score_changed = [](int score) { ars::log_debug("score " + std::to_string(score)); };
    game.events().on_game_over = [](int score) { ars::log_info("game over, final score " + std::to_string(score)); };

    ars::FrameClock clock{};
    clock.tick_hz = 1000.0;
    ars::FixedStepClock stepper{};
    stepper.step_seconds = game.config().tick_ms / 1000.0;

    Canvas canvas{};
    ars::RenderSnapshot snap{};
    bool running = true;
    bool paused = false;
    int frames = 0;
    float fps_accum = 0.0f;

    while (running)
    {
        const float dt = std::clamp(clock.begin_frame(runtime.ticks_ms()), 0.0f, 0.25f);

        ars::PlatformInputState pin{};
        if (!runtime.pump_input(pin) || pin.quit) break;
        if (pin.toggle_pause)
        {
            paused = !paused;
            stepper.reset();
        }
        game.handle_input(pin.events);

        const int steps = paused ? 0 : stepper.consume(dt);
        for (int s = 0; s < steps; ++s)
        {
            game.advance_frame();
            bursts.tick();
        }

        game.build_snapshot(snap);
        draw_frame(canvas, snap, visuals, bursts);
        runtime.upload_rgba8(canvas.rgba.data(), canvas.w, canvas.h, canvas.w * 4);
        runtime.present();

        frames++;
        fps_accum += dt;
        if (fps_accum >= 0.25f)
        {
            const float fps = (fps_accum > 1e-6f) ? ((float)frames / fps_accum) : 0.0f;
            runtime.set_title(hud_title(snap, fps, paused));
            frames = 0;
            fps_accum = 0.0f;
        }
    }

    return 0;
}
