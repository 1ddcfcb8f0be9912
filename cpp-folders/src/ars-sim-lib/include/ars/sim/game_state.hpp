#pragma once

/*
    ARS SIM LIB

    FILE: game_state.hpp
    MODULE: sim
    PURPOSE: The single owned state of one play session. Every sub-system reads and writes
            it through SimContext; a reset replaces it wholesale.
*/


#include <cstdint>
#include <random>
#include <vector>

#include <glm/glm.hpp>

#include "ars/camera/camera_rig.hpp"
#include "ars/camera/view_presets.hpp"
#include "ars/input/input_latch.hpp"
#include "ars/logic/task_scheduler.hpp"
#include "ars/sim/entities.hpp"
#include "ars/sim/entity_pool.hpp"

namespace ars
{
    enum class SessionPhase : uint8_t
    {
        Playing = 0,
        Dying = 1,
        GameOver = 2
    };

    inline const char* session_phase_name(SessionPhase phase)
    {
        switch (phase)
        {
            case SessionPhase::Playing: return "playing";
            case SessionPhase::Dying: return "dying";
            case SessionPhase::GameOver: return "game_over";
        }
        return "unknown";
    }

    struct ViewState
    {
        ViewId current = ViewId::Default;
        bool transitioning = false;
        ViewId target = ViewId::Default;
        CameraPose start_pose{};
        CameraPose target_pose{};
        double progress = 0.0;
    };

    struct DeathState
    {
        ObstacleId killer{};
        CameraPose camera_start{};
        glm::vec3 camera_target{0.0f};
        double progress = 0.0;
    };

    struct ScheduledTasks
    {
        TaskHandle spawn{};
        TaskHandle death_camera{};
        TaskHandle rapid_fire{};
        TaskHandle game_over_notice{};
    };

    using ObstaclePool = EntityPool<Obstacle, ObstacleId>;
    using ProjectilePool = EntityPool<Projectile, ProjectileId>;

    struct GameState
    {
        int score = 0;
        bool game_over = false;
        bool death_animation = false;

        Player player{};
        ObstaclePool obstacles{};
        ProjectilePool projectiles{};
        std::vector<Star> stars{};

        CameraRig camera{};
        ViewState view{};
        DeathState death{};
        InputLatch input{};
        ScheduledTasks tasks{};

        std::mt19937 rng{};
        uint64_t frame_index = 0;

        // Playing accepts fire / view commands and runs the gameplay tick.
        bool gameplay_active() const { return !death_animation && !game_over; }
    };

    // Uniform draw in [0, 1).
    inline float random01(GameState& s)
    {
        std::uniform_real_distribution<float> dist(0.0f, 1.0f);
        return dist(s.rng);
    }

    enum class EntityKind : uint8_t
    {
        Player = 0,
        Obstacle = 1,
        Projectile = 2,
        Star = 3
    };

    // Read-only walk over one entity collection in spawn order.
    template <typename Fn>
    void visit_live(const GameState& s, EntityKind kind, Fn&& fn)
    {
        switch (kind)
        {
            case EntityKind::Player:
                fn(s.player.tr);
                break;
            case EntityKind::Obstacle:
                s.obstacles.for_each_live([&](const ObstacleId&, const Obstacle& o) { fn(o.tr); });
                break;
            case EntityKind::Projectile:
                s.projectiles.for_each_live([&](const ProjectileId&, const Projectile& p) { fn(p.tr); });
                break;
            case EntityKind::Star:
                for (const Star& star : s.stars) fn(star.tr);
                break;
        }
    }
}
