#pragma once

/*
    ARS SIM LIB

    FILE: render_snapshot.hpp
    MODULE: app
    PURPOSE: Immutable per-frame copy of everything a renderer needs: entity transforms and
            camera matrices. Built on the simulation thread after each frame.
*/


#include <cstddef>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

#include "ars/camera/view_presets.hpp"
#include "ars/sim/game_state.hpp"

namespace ars
{
    struct RenderItem
    {
        EntityKind kind = EntityKind::Star;
        glm::vec3 pos{0.0f};
        glm::vec3 rot_euler{0.0f};
        glm::vec3 scl{1.0f};
        float radius = 1.0f;  // unscaled bounding radius of the visual
        float opacity = 1.0f;
    };

    struct RenderSnapshot
    {
        uint64_t frame_index = 0;
        std::vector<RenderItem> items{};

        glm::vec3 camera_pos{0.0f};
        glm::mat4 view{1.0f};
        glm::mat4 proj{1.0f};
        glm::mat4 viewproj{1.0f};

        ViewId view_id = ViewId::Default;
        bool transitioning = false;
        SessionPhase phase = SessionPhase::Playing;
        int score = 0;
        bool shield = false;
        bool rapid_fire = false;

        std::size_t count(EntityKind kind) const
        {
            std::size_t n = 0;
            for (const RenderItem& it : items)
            {
                if (it.kind == kind) ++n;
            }
            return n;
        }
    };

    inline constexpr float kStarRadius = 0.05f;

    inline void build_render_snapshot(const GameState& s, SessionPhase phase, RenderSnapshot& out)
    {
        out.items.clear();
        out.items.reserve(1 + s.stars.size() + s.obstacles.live_count() + s.projectiles.live_count());

        for (const Star& star : s.stars)
        {
            RenderItem ri{};
            ri.kind = EntityKind::Star;
            ri.pos = star.tr.pos;
            ri.radius = kStarRadius;
            out.items.push_back(ri);
        }

        {
            RenderItem ri{};
            ri.kind = EntityKind::Player;
            ri.pos = s.player.tr.pos;
            ri.rot_euler = s.player.tr.rot_euler;
            ri.scl = s.player.tr.scl;
            ri.radius = glm::length(s.player.half_extents);
            ri.opacity = s.player.cockpit_opacity;
            out.items.push_back(ri);
        }

        s.obstacles.for_each_live([&](const ObstacleId&, const Obstacle& o) {
            RenderItem ri{};
            ri.kind = EntityKind::Obstacle;
            ri.pos = o.tr.pos;
            ri.rot_euler = o.tr.rot_euler;
            ri.scl = o.tr.scl;
            ri.radius = o.size;
            out.items.push_back(ri);
        });

        s.projectiles.for_each_live([&](const ProjectileId&, const Projectile& p) {
            RenderItem ri{};
            ri.kind = EntityKind::Projectile;
            ri.pos = p.tr.pos;
            ri.scl = p.tr.scl;
            ri.radius = p.radius;
            out.items.push_back(ri);
        });

        out.frame_index = s.frame_index;
        out.camera_pos = s.camera.pos;
        out.view = s.camera.view();
        out.proj = s.camera.proj();
        out.viewproj = out.proj * out.view;
        out.view_id = s.view.current;
        out.transitioning = s.view.transitioning;
        out.phase = phase;
        out.score = s.score;
        out.shield = s.player.shield;
        out.rapid_fire = s.player.rapid_fire;
    }
}
