#pragma once

/*
    ARS SIM LIB

    FILE: player_control.hpp
    MODULE: sim
    PURPOSE: Player creation, input-driven velocity, the frustum-bounded update with
            exact revert, visual tilt, and firing (single shot and held rapid fire).
*/


#include <array>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include "ars/camera/view_presets.hpp"
#include "ars/core/invariant.hpp"
#include "ars/core/log.hpp"
#include "ars/geometry/frustum.hpp"
#include "ars/sim/sim_context.hpp"

namespace ars
{
    inline void init_player(const SimContext& ctx)
    {
        const PlayerParams& pp = ctx.config->player;
        Player& p = ctx.state->player;

        p = Player{};
        p.tr.pos = pp.spawn;
        p.speed = pp.speed;
        p.half_extents = pp.half_extents;
        p.shield = pp.start_shield;
        p.rapid_fire = pp.start_rapid_fire;
        p.visual = attach_visual(ctx.visuals, VisualKind::Player);
        p.cockpit = attach_visual(ctx.visuals, VisualKind::PlayerCockpit);
    }

    inline void apply_input_to_velocity(Player& p, const InputLatch& in)
    {
        p.tr.vel.x = (float)in.axis_x * p.speed;
        p.tr.vel.y = (float)in.axis_y * p.speed;
    }

    // Edges of the craft, not its center, gate the bound.
    inline std::array<glm::vec3, 4> frustum_edge_points(const Player& p, float margin)
    {
        const glm::vec3& c = p.tr.pos;
        const float dx = p.tr.scl.x * margin;
        const float dy = p.tr.scl.y * margin;
        return {
            glm::vec3(c.x + dx, c.y, c.z),
            glm::vec3(c.x - dx, c.y, c.z),
            glm::vec3(c.x, c.y + dy, c.z),
            glm::vec3(c.x, c.y - dy, c.z)
        };
    }

    inline bool player_within_frustum(const Player& p, const Frustum& f, float margin)
    {
        return frustum_contains_all(f, frustum_edge_points(p, margin));
    }

    // Integrates one step and restores the pre-tick position bit-for-bit when any
    // edge point leaves the camera frustum. Returns false on a reverted step.
    inline bool step_player(Player& p, const Frustum& f, const PlayerParams& pp)
    {
        const glm::vec3 prev = p.tr.pos;
        p.tr.integrate();

        bool accepted = true;
        if (repair_non_finite(p.tr.pos, prev, "player position"))
        {
            accepted = false;
        }
        else if (!player_within_frustum(p, f, pp.edge_margin))
        {
            p.tr.pos = prev;
            accepted = false;
        }

        const float target_z = -p.tr.vel.x * pp.tilt_amount;
        const float target_x = -glm::half_pi<float>() + p.tr.vel.y * pp.tilt_amount;
        p.tr.rot_euler.z += (target_z - p.tr.rot_euler.z) * pp.tilt_smoothing;
        p.tr.rot_euler.x += (target_x - p.tr.rot_euler.x) * pp.tilt_smoothing;
        return accepted;
    }

    inline void update_player(const SimContext& ctx)
    {
        GameState& s = *ctx.state;
        Player& p = s.player;

        apply_input_to_velocity(p, s.input);
        step_player(p, s.camera.frustum(), ctx.config->player);
        p.cockpit_opacity = view_preset(s.view.current).hides_cockpit ? 0.0f : 1.0f;
    }

    inline ProjectileId spawn_projectile(const SimContext& ctx, const glm::vec3& origin)
    {
        const ProjectileParams& pp = ctx.config->projectile;

        Projectile pr{};
        pr.tr.pos = origin;
        pr.speed = pp.speed;
        pr.radius = pp.radius;
        pr.tr.vel = glm::vec3(0.0f, 0.0f, -pp.speed);

        VisualDesc desc{};
        desc.radius = pr.radius;
        pr.visual = attach_visual(ctx.visuals, VisualKind::Projectile, desc);
        pr.visual.update_transform(pr.tr.pos, pr.tr.rot_euler, pr.tr.scl);

        return ctx.state->projectiles.spawn(std::move(pr));
    }

    // Fire while gameplay is frozen is ignored.
    inline ProjectileId shoot(const SimContext& ctx)
    {
        GameState& s = *ctx.state;
        if (!s.gameplay_active())
        {
            log_debug("fire ignored: gameplay frozen");
            return ProjectileId{};
        }
        return spawn_projectile(ctx, s.player.tr.pos + ctx.config->player.muzzle_offset);
    }

    inline void stop_rapid_fire(const SimContext& ctx)
    {
        ctx.tasks->cancel(ctx.state->tasks.rapid_fire);
    }

    inline void schedule_rapid_fire(const SimContext& ctx);

    inline void on_rapid_fire_timer(const SimContext& ctx)
    {
        GameState& s = *ctx.state;
        s.tasks.rapid_fire = TaskHandle{};
        if (!s.input.fire_held || !s.player.rapid_fire || !s.gameplay_active()) return;
        shoot(ctx);
        schedule_rapid_fire(ctx);
    }

    inline void schedule_rapid_fire(const SimContext& ctx)
    {
        ctx.state->tasks.rapid_fire = ctx.tasks->schedule_after(
            "rapid_fire",
            ctx.config->player.rapid_fire_interval_ms,
            [ctx]() { on_rapid_fire_timer(ctx); });
    }

    // Expects the latch to already hold fire_held.
    inline void on_fire_pressed(const SimContext& ctx)
    {
        GameState& s = *ctx.state;
        if (!shoot(ctx).valid()) return;
        if (s.player.rapid_fire && !ctx.tasks->pending(s.tasks.rapid_fire))
        {
            schedule_rapid_fire(ctx);
        }
    }

    inline void on_fire_released(const SimContext& ctx)
    {
        stop_rapid_fire(ctx);
    }
}
