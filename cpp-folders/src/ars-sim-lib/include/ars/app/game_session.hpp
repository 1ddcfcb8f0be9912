#pragma once

/*
    ARS SIM LIB

    FILE: game_session.hpp
    MODULE: app
    PURPOSE: One play session: owns the state, the task scheduler, the gameplay systems and
            the session phase machine, and advances them in a fixed order per tick.
*/


#include <cstdint>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "ars/app/render_snapshot.hpp"
#include "ars/camera/view_presets.hpp"
#include "ars/config/game_config.hpp"
#include "ars/core/log.hpp"
#include "ars/core/result.hpp"
#include "ars/input/input_latch.hpp"
#include "ars/logic/state_machine.hpp"
#include "ars/logic/task_scheduler.hpp"
#include "ars/sim/death_sequence.hpp"
#include "ars/sim/game_events.hpp"
#include "ars/sim/game_state.hpp"
#include "ars/sim/player_control.hpp"
#include "ars/sim/sim_context.hpp"
#include "ars/sim/simulation_tick.hpp"
#include "ars/sim/spawn_scheduler.hpp"
#include "ars/sim/star_field.hpp"
#include "ars/sim/view_director.hpp"

namespace ars
{
    using SessionPhaseMachine = StateMachine<SessionPhase, SimContext>;

    // Scheduled tasks capture pointers into the session, so it stays put.
    class Game
    {
    public:
        explicit Game(GameConfig cfg = {}, IVisualFactory* visuals = nullptr)
            : cfg_(std::move(cfg))
            , visuals_(visuals)
        {
            for (const std::string& fix : validate_config(cfg_)) log_warn("config: " + fix);

            seed_ = cfg_.seed != 0 ? cfg_.seed : std::random_device{}();
            state_.rng.seed(seed_);

            ctx_.state = &state_;
            ctx_.tasks = &tasks_;
            ctx_.config = &cfg_;
            ctx_.events = &events_;
            ctx_.visuals = visuals_;

            install_gameplay_systems(systems_);
            build_phase_machine();
            reset();
        }

        Game(const Game&) = delete;
        Game& operator=(const Game&) = delete;
        Game(Game&&) = delete;
        Game& operator=(Game&&) = delete;

        ~Game()
        {
            tasks_.cancel_all();
        }

        // Cancels every pending task, then rebuilds the session from scratch. The RNG
        // carries over so a replay draws fresh values, and the pools are cleared in
        // place so ids from the previous session stay dead.
        void reset()
        {
            tasks_.cancel_all();

            std::mt19937 rng = state_.rng;
            ObstaclePool obstacles = std::move(state_.obstacles);
            ProjectilePool projectiles = std::move(state_.projectiles);
            obstacles.clear();
            projectiles.clear();

            state_ = GameState{};
            state_.rng = rng;
            state_.obstacles = std::move(obstacles);
            state_.projectiles = std::move(projectiles);

            state_.camera.fov_y_radians = glm::radians(cfg_.camera.fov_y_degrees);
            state_.camera.aspect = cfg_.camera.aspect;
            state_.camera.znear = cfg_.camera.znear;
            state_.camera.zfar = cfg_.camera.zfar;

            init_player(ctx_);
            populate_star_field(state_, cfg_.stars);
            snap_to_view(ctx_, cfg_.camera.start_view);
            phase_.start(SessionPhase::Playing, ctx_);
            start_spawn_timer(ctx_);

            ++session_count_;
            log_info("session " + std::to_string(session_count_) + " started (seed " + std::to_string(seed_) +
                     ", view " + view_name(state_.view.current) + ")");
            sync_visuals();
        }

        void handle_input(std::span<const InputEvent> events)
        {
            for (const InputEvent& e : events)
            {
                state_.input = reduce_input_latch(state_.input, std::span<const InputEvent>(&e, 1));
                switch (e.type)
                {
                    case InputEventType::MoveBegin:
                    case InputEventType::MoveEnd:
                        break;
                    case InputEventType::FireBegin:
                        on_fire_pressed(ctx_);
                        break;
                    case InputEventType::FireEnd:
                        on_fire_released(ctx_);
                        break;
                    case InputEventType::SelectView:
                        request_view(ctx_, e.view);
                        break;
                    case InputEventType::Reset:
                        reset();
                        break;
                    case InputEventType::ToggleShield:
                        state_.player.shield = !state_.player.shield;
                        log_info(std::string("shield ") + (state_.player.shield ? "on" : "off"));
                        break;
                    case InputEventType::ToggleRapidFire:
                        state_.player.rapid_fire = !state_.player.rapid_fire;
                        if (!state_.player.rapid_fire) stop_rapid_fire(ctx_);
                        log_info(std::string("rapid fire ") + (state_.player.rapid_fire ? "on" : "off"));
                        break;
                }
            }
        }

        bool select_view(ViewId view)
        {
            return request_view(ctx_, view);
        }

        bool select_view(std::string_view name)
        {
            const Result<ViewId> parsed = parse_view_id(name);
            if (!parsed)
            {
                log_warn("select_view: " + parsed.error);
                return false;
            }
            return request_view(ctx_, parsed.value);
        }

        // One fixed tick: camera, gameplay, timers, phase, then visuals.
        void advance_frame()
        {
            ++state_.frame_index;

            update_live_camera(ctx_);
            tick_view_transition(ctx_);
            run_simulation_tick(systems_, ctx_);
            tasks_.advance(cfg_.tick_ms);
            phase_.tick(ctx_, (float)(cfg_.tick_ms / 1000.0));

            sync_visuals();
        }

        void build_snapshot(RenderSnapshot& out) const
        {
            build_render_snapshot(state_, phase(), out);
        }

        RenderSnapshot snapshot() const
        {
            RenderSnapshot out{};
            build_snapshot(out);
            return out;
        }

        GameEvents& events() { return events_; }
        const GameConfig& config() const { return cfg_; }
        const GameState& state() const { return state_; }
        GameState& state() { return state_; }
        const TaskScheduler& tasks() const { return tasks_; }
        const SimContext& context() const { return ctx_; }
        const SimSystemProcessor& systems() const { return systems_; }

        SessionPhase phase() const { return phase_.current_state(); }
        uint64_t session_count() const { return session_count_; }
        uint32_t seed() const { return seed_; }

    private:
        void build_phase_machine()
        {
            SessionPhaseMachine::StateCallbacks playing{};
            playing.on_exit = [](SimContext& c) {
                log_debug("phase: leaving playing at score " + std::to_string(c.state->score));
            };

            SessionPhaseMachine::StateCallbacks game_over{};
            game_over.on_enter = [](SimContext& c) { schedule_game_over_notice(c); };

            phase_.add_state(SessionPhase::Playing, std::move(playing));
            phase_.add_state(SessionPhase::Dying);
            phase_.add_state(SessionPhase::GameOver, std::move(game_over));

            phase_.add_transition(SessionPhase::Playing, SessionPhase::Dying,
                [](const SimContext& c) { return c.state->death_animation; });
            phase_.add_transition(SessionPhase::Dying, SessionPhase::GameOver,
                [](const SimContext& c) { return c.state->game_over; });
            phase_.add_transition(SessionPhase::Playing, SessionPhase::GameOver,
                [](const SimContext& c) { return c.state->game_over; }, 1);

            phase_.set_observer([](SessionPhase from, SessionPhase to) {
                log_debug(std::string("phase: ") + session_phase_name(from) + " -> " + session_phase_name(to));
            });
        }

        void sync_visuals()
        {
            Player& p = state_.player;
            p.visual.update_transform(p.tr.pos, p.tr.rot_euler, p.tr.scl);
            p.cockpit.update_transform(p.tr.pos, p.tr.rot_euler, p.tr.scl);
            p.cockpit.set_opacity(p.cockpit_opacity);

            state_.obstacles.for_each_live([](const ObstacleId&, Obstacle& o) {
                o.visual.update_transform(o.tr.pos, o.tr.rot_euler, o.tr.scl);
            });
            state_.projectiles.for_each_live([](const ProjectileId&, Projectile& pr) {
                pr.visual.update_transform(pr.tr.pos, pr.tr.rot_euler, pr.tr.scl);
            });
        }

        GameConfig cfg_{};
        GameEvents events_{};
        IVisualFactory* visuals_ = nullptr;

        GameState state_{};
        TaskScheduler tasks_{};
        SimSystemProcessor systems_{};
        SessionPhaseMachine phase_{};
        SimContext ctx_{};

        uint32_t seed_ = 0;
        uint64_t session_count_ = 0;
    };
}
