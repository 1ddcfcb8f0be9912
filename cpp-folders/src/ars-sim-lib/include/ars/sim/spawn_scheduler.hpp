#pragma once

/*
    ARS SIM LIB

    FILE: spawn_scheduler.hpp
    MODULE: sim
    PURPOSE: Obstacle factory and the self-rescheduling spawn timer. The timer checks
            game_over before every pass and is cancelled on game over and on reset, so a
            stale session can never spawn into a fresh one.
*/


#include <string>

#include <glm/glm.hpp>

#include "ars/camera/camera_math.hpp"
#include "ars/core/log.hpp"
#include "ars/sim/difficulty.hpp"
#include "ars/sim/sim_context.hpp"

namespace ars
{
    struct ObstacleSpawnParams
    {
        glm::vec3 pos{0.0f};
        float size = 1.0f;
        float speed = 0.2f;
        float rotation_speed = 0.0f;
        glm::vec3 rotation_axis{0.0f, 1.0f, 0.0f};
    };

    inline glm::vec3 random_unit_axis(GameState& s)
    {
        for (int attempt = 0; attempt < 8; ++attempt)
        {
            const glm::vec3 v(random01(s) - 0.5f, random01(s) - 0.5f, random01(s) - 0.5f);
            const float len = glm::length(v);
            if (len > 1e-4f) return v / len;
        }
        return glm::vec3(0.0f, 1.0f, 0.0f);
    }

    inline ObstacleSpawnParams roll_obstacle_params(GameState& s, const GameConfig& cfg, const DifficultyLevel& level)
    {
        const ObstacleParams& op = cfg.obstacle;

        ObstacleSpawnParams p{};
        p.pos.x = (random01(s) - 0.5f) * op.spawn_width;
        p.pos.y = (random01(s) - 0.5f) * op.spawn_height;
        p.pos.z = -op.horizon_distance;
        p.size = op.size_min + random01(s) * (op.size_max - op.size_min);
        p.speed = level.obstacle_speed;
        p.rotation_speed = (random01(s) * 2.0f * op.rotation_speed_range - op.rotation_speed_range) * level.rotation_scale;
        p.rotation_axis = random_unit_axis(s);
        return p;
    }

    // Visual scale shrinks with distance to the camera; the hitbox follows at a fraction.
    inline void rescale_obstacle(Obstacle& o, const glm::vec3& camera_pos, const ObstacleParams& op)
    {
        const double dist = (double)glm::distance(o.tr.pos, camera_pos);
        const float t = (float)smoothstep(dist, op.scale_near_distance, op.scale_far_distance);
        const float scale = lerp(op.scale_near, op.scale_far, t);
        o.tr.scl = glm::vec3(scale);
        o.hitbox.scl = glm::vec3(scale * op.hitbox_scale_ratio);
        o.hitbox.pos = o.tr.pos;
    }

    inline ObstacleId spawn_obstacle(const SimContext& ctx, const ObstacleSpawnParams& params)
    {
        GameState& s = *ctx.state;
        const ObstacleParams& op = ctx.config->obstacle;

        Obstacle o{};
        o.tr.pos = params.pos;
        o.size = params.size;
        o.hitbox_radius = params.size * op.hitbox_radius_ratio;
        o.speed = params.speed;
        o.direction = glm::vec3(0.0f, 0.0f, 1.0f);
        o.tr.vel = o.direction * o.speed;
        o.rotation_speed = params.rotation_speed;
        o.rotation_axis = params.rotation_axis;
        rescale_obstacle(o, s.camera.pos, op);

        VisualDesc desc{};
        desc.size = o.size;
        desc.seed = s.rng();
        o.visual = attach_visual(ctx.visuals, VisualKind::Obstacle, desc);
        o.visual.update_transform(o.tr.pos, o.tr.rot_euler, o.tr.scl);

        return s.obstacles.spawn(std::move(o));
    }

    // One scheduling pass. Returns the number of obstacles spawned.
    inline int run_spawn_pass(const SimContext& ctx)
    {
        GameState& s = *ctx.state;
        if (s.game_over) return 0;

        const DifficultyLevel level = difficulty_for(s.score, *ctx.config);
        for (int i = 0; i < level.num_obstacles; ++i)
        {
            spawn_obstacle(ctx, roll_obstacle_params(s, *ctx.config, level));
        }
        return level.num_obstacles;
    }

    inline void schedule_next_spawn(const SimContext& ctx);

    inline void on_spawn_timer(const SimContext& ctx)
    {
        GameState& s = *ctx.state;
        s.tasks.spawn = TaskHandle{};
        if (s.game_over)
        {
            log_debug("spawn timer: game over, not rescheduling");
            return;
        }
        run_spawn_pass(ctx);
        schedule_next_spawn(ctx);
    }

    inline void schedule_next_spawn(const SimContext& ctx)
    {
        GameState& s = *ctx.state;
        const double delay = spawn_delay_ms(s.score, ctx.config->difficulty);
        s.tasks.spawn = ctx.tasks->schedule_after("spawn_obstacles", delay, [ctx]() { on_spawn_timer(ctx); });
    }

    // Spawns the first wave immediately, then keeps rescheduling until stopped.
    inline void start_spawn_timer(const SimContext& ctx)
    {
        GameState& s = *ctx.state;
        ctx.tasks->cancel(s.tasks.spawn);
        if (s.game_over) return;

        run_spawn_pass(ctx);
        schedule_next_spawn(ctx);
        log_debug("spawn timer started");
    }

    inline void stop_spawn_timer(const SimContext& ctx)
    {
        if (ctx.tasks->cancel(ctx.state->tasks.spawn)) log_info("spawn timer stopped");
    }
}
