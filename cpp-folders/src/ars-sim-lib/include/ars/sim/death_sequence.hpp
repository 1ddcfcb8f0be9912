#pragma once

/*
    ARS SIM LIB

    FILE: death_sequence.hpp
    MODULE: sim
    PURPOSE: Terminal camera-only animation between a fatal collision and game over.
            Runs as a per-frame task so it keeps going while gameplay is frozen.
*/


#include <string>

#include <glm/glm.hpp>

#include "ars/camera/camera_math.hpp"
#include "ars/core/invariant.hpp"
#include "ars/core/log.hpp"
#include "ars/sim/player_control.hpp"
#include "ars/sim/sim_context.hpp"
#include "ars/sim/spawn_scheduler.hpp"
#include "ars/sim/view_director.hpp"

namespace ars
{
    inline void signal_game_over(const SimContext& ctx)
    {
        GameState& s = *ctx.state;
        if (s.game_over) return;

        s.game_over = true;
        stop_spawn_timer(ctx);
        stop_rapid_fire(ctx);
        log_info("game over, final score " + std::to_string(s.score));
    }

    inline TaskStatus step_death_camera(const SimContext& ctx)
    {
        GameState& s = *ctx.state;
        DeathState& d = s.death;
        if (!s.death_animation)
        {
            s.tasks.death_camera = TaskHandle{};
            return TaskStatus::Done;
        }

        const double step = ctx.config->death.camera_step;
        ARS_INVARIANT(step > 0.0, "death camera step must be positive");
        d.progress += step > 0.0 ? step : 1.0;

        const float t = (float)smoothstep(d.progress, 0.0, 1.0);
        s.camera.pos = glm::mix(d.camera_start.pos, d.camera_target, t);
        s.camera.look_at(s.player.tr.pos);

        if (blend_done(d.progress))
        {
            s.tasks.death_camera = TaskHandle{};
            signal_game_over(ctx);
            return TaskStatus::Done;
        }
        return TaskStatus::Continue;
    }

    // Entered once per life; later calls leave the captured state untouched.
    inline bool start_death_sequence(const SimContext& ctx, ObstacleId killer)
    {
        GameState& s = *ctx.state;
        if (s.death_animation || s.game_over)
        {
            log_debug("death sequence already active");
            return false;
        }

        const DeathParams& dp = ctx.config->death;
        s.death_animation = true;
        abort_view_transition(s);

        DeathState& d = s.death;
        d.killer = killer;
        d.camera_start = s.camera.pose();
        d.camera_target = s.player.tr.pos + glm::vec3(dp.offset_distance, dp.offset_distance * 0.5f, dp.offset_distance);
        d.progress = 0.0;

        s.player.tr.vel *= dp.slow_factor;
        if (Obstacle* o = s.obstacles.get(killer))
        {
            o->speed *= dp.slow_factor;
            o->tr.vel = o->direction * o->speed;
        }

        stop_rapid_fire(ctx);
        log_info("death sequence started, score " + std::to_string(s.score));
        notify_death_started(ctx.events, s.player.tr.pos);

        s.tasks.death_camera = ctx.tasks->schedule_per_frame("death_camera", [ctx]() { return step_death_camera(ctx); });
        return true;
    }

    inline void schedule_game_over_notice(const SimContext& ctx)
    {
        GameState& s = *ctx.state;
        ctx.tasks->cancel(s.tasks.game_over_notice);
        s.tasks.game_over_notice = ctx.tasks->schedule_after(
            "game_over_notice",
            ctx.config->death.game_over_notice_delay_ms,
            [ctx]() {
                ctx.state->tasks.game_over_notice = TaskHandle{};
                notify_game_over(ctx.events, ctx.state->score);
            });
    }
}
