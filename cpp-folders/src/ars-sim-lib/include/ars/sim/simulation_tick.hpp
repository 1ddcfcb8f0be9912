#pragma once

/*
    ARS SIM LIB

    FILE: simulation_tick.hpp
    MODULE: sim
    PURPOSE: Gameplay tick as an ordered list of systems: stars -> player -> obstacles ->
            projectiles. Systems only mutate GameState and emit events.
*/


#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "ars/camera/camera_math.hpp"
#include "ars/core/invariant.hpp"
#include "ars/core/log.hpp"
#include "ars/sim/collision.hpp"
#include "ars/sim/death_sequence.hpp"
#include "ars/sim/player_control.hpp"
#include "ars/sim/sim_context.hpp"
#include "ars/sim/spawn_scheduler.hpp"
#include "ars/sim/star_field.hpp"

namespace ars
{
    // Gameplay removal: drops the obstacle and reports where it died.
    inline bool destroy_obstacle(const SimContext& ctx, ObstacleId id, DestroyCause cause)
    {
        GameState& s = *ctx.state;
        const Obstacle* o = s.obstacles.get(id);
        if (!o) return false;
        const glm::vec3 pos = o->tr.pos;
        s.obstacles.destroy(id);
        notify_obstacle_destroyed(ctx.events, pos, cause);
        return true;
    }

    inline bool destroy_projectile(const SimContext& ctx, ProjectileId id)
    {
        return ctx.state->projectiles.destroy(id);
    }

    inline void add_score(const SimContext& ctx, int delta)
    {
        GameState& s = *ctx.state;
        s.score = repair_negative(s.score + delta, "score");
        notify_score_changed(ctx.events, s.score);
    }

    // Integrate, rescale by camera distance, spin the visual about its fixed axis.
    inline void step_obstacle(Obstacle& o, const glm::vec3& camera_pos, const ObstacleParams& op)
    {
        const glm::vec3 prev = o.tr.pos;
        o.tr.integrate();
        repair_non_finite(o.tr.pos, prev, "obstacle position");
        rescale_obstacle(o, camera_pos, op);

        o.spin = glm::normalize(o.spin * glm::angleAxis(o.rotation_speed, o.rotation_axis));
        o.tr.rot_euler = euler_xyz_from_quat(o.spin);
    }

    class ISimSystem
    {
    public:
        virtual ~ISimSystem() = default;
        virtual const char* name() const = 0;
        virtual void tick(const SimContext& ctx) = 0;
    };

    class SimSystemProcessor
    {
    public:
        template <typename TSystem, typename... Args>
        TSystem& add_system(Args&&... args)
        {
            auto s = std::make_unique<TSystem>(std::forward<Args>(args)...);
            TSystem& ref = *s;
            systems_.push_back(std::move(s));
            return ref;
        }

        void tick(const SimContext& ctx)
        {
            for (auto& s : systems_) s->tick(ctx);
        }

        std::size_t system_count() const { return systems_.size(); }

        std::vector<std::string> system_names() const
        {
            std::vector<std::string> out{};
            for (const auto& s : systems_) out.emplace_back(s->name());
            return out;
        }

    private:
        std::vector<std::unique_ptr<ISimSystem>> systems_{};
    };

    class StarSystem final : public ISimSystem
    {
    public:
        const char* name() const override { return "stars"; }

        void tick(const SimContext& ctx) override
        {
            GameState& s = *ctx.state;
            for (Star& star : s.stars) step_star(s, ctx.config->stars, star);
        }
    };

    class PlayerSystem final : public ISimSystem
    {
    public:
        const char* name() const override { return "player"; }

        void tick(const SimContext& ctx) override
        {
            update_player(ctx);
        }
    };

    // Newest first, so removals never disturb the obstacles still to visit.
    // A fatal hit ends the pass.
    class ObstacleSystem final : public ISimSystem
    {
    public:
        const char* name() const override { return "obstacles"; }

        void tick(const SimContext& ctx) override
        {
            GameState& s = *ctx.state;
            const ObstacleParams& op = ctx.config->obstacle;
            const std::vector<ObstacleId> ids = s.obstacles.live_ids();

            for (auto it = ids.rbegin(); it != ids.rend(); ++it)
            {
                Obstacle* o = s.obstacles.get(*it);
                if (!o) continue;

                step_obstacle(*o, s.camera.pos, op);

                if (o->tr.pos.z > op.pass_z)
                {
                    destroy_obstacle(ctx, *it, DestroyCause::PassedPlayer);
                    continue;
                }

                if (!player_hits(s.player, *o)) continue;

                if (s.player.shield)
                {
                    destroy_obstacle(ctx, *it, DestroyCause::ShieldImpact);
                    continue;
                }

                start_death_sequence(ctx, *it);
                break;
            }
        }
    };

    class ProjectileSystem final : public ISimSystem
    {
    public:
        const char* name() const override { return "projectiles"; }

        void tick(const SimContext& ctx) override
        {
            GameState& s = *ctx.state;
            const float far_z = ctx.config->projectile.far_z;
            const std::vector<ProjectileId> ids = s.projectiles.live_ids();

            for (auto it = ids.rbegin(); it != ids.rend(); ++it)
            {
                Projectile* p = s.projectiles.get(*it);
                if (!p) continue;

                const glm::vec3 prev = p->tr.pos;
                p->tr.integrate();
                repair_non_finite(p->tr.pos, prev, "projectile position");

                bool hit = false;
                const std::vector<ObstacleId> targets = s.obstacles.live_ids();
                for (auto ot = targets.rbegin(); ot != targets.rend(); ++ot)
                {
                    const Obstacle* o = s.obstacles.get(*ot);
                    if (!o || !projectile_hits(*p, *o)) continue;

                    destroy_obstacle(ctx, *ot, DestroyCause::ProjectileHit);
                    add_score(ctx, 1);
                    hit = true;
                    break;
                }

                if (hit || p->tr.pos.z < far_z) destroy_projectile(ctx, *it);
            }
        }
    };

    inline void install_gameplay_systems(SimSystemProcessor& processor)
    {
        processor.add_system<StarSystem>();
        processor.add_system<PlayerSystem>();
        processor.add_system<ObstacleSystem>();
        processor.add_system<ProjectileSystem>();
    }

    // The freeze is sampled once per tick: a death started by the obstacle pass
    // still lets this tick's projectile pass finish.
    inline bool run_simulation_tick(SimSystemProcessor& processor, const SimContext& ctx)
    {
        if (!ctx.valid() || !ctx.state->gameplay_active()) return false;
        processor.tick(ctx);
        return true;
    }
}
