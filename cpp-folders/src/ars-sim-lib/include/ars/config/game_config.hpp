#pragma once

/*
    ARS SIM LIB

    FILE: game_config.hpp
    MODULE: config
    PURPOSE: Tunable parameters of a play session. All motion values are per simulation
            tick, all durations are milliseconds of simulation time.
*/


#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "ars/camera/view_presets.hpp"

namespace ars
{
    struct PlayerParams
    {
        glm::vec3 spawn{0.0f, 0.0f, 10.0f};
        float speed = 0.2f;
        glm::vec3 half_extents{2.0f, 2.0f, 1.0f}; // hull + fins
        float edge_margin = 1.0f;
        float tilt_amount = 0.2f;
        float tilt_smoothing = 0.1f;
        bool start_shield = false;
        bool start_rapid_fire = false;
        double rapid_fire_interval_ms = 100.0;
        glm::vec3 muzzle_offset{0.0f, 0.0f, -1.0f};
    };

    struct ProjectileParams
    {
        float speed = 0.5f;
        float radius = 0.2f;
        float far_z = -50.0f;
    };

    struct ObstacleParams
    {
        float horizon_distance = 50.0f;
        float spawn_width = 40.0f;
        float spawn_height = 20.0f;
        float size_min = 1.0f;
        float size_max = 2.0f;
        float hitbox_radius_ratio = 0.8f;
        float hitbox_scale_ratio = 0.8f;
        float pass_z = 15.0f;
        float base_speed = 0.1f;
        float speed_per_score = 0.01f;
        float speed_multiplier = 2.0f;
        float rotation_speed_range = 0.01f;
        float rotation_score_divisor = 50.0f;
        float scale_near = 1.5f;
        float scale_far = 0.5f;
        float scale_near_distance = 5.0f;
        float scale_far_distance = 50.0f;
    };

    struct DifficultyParams
    {
        int max_difficulty_score = 35;
        int max_obstacles = 5;
        int score_per_extra_obstacle = 10;
        double base_spawn_delay_ms = 1000.0;
        double spawn_delay_per_score_ms = 20.0;
        double min_spawn_delay_ms = 300.0;
    };

    struct StarParams
    {
        int count = 200;
        float fall_speed = 0.1f;
        float floor_y = -50.0f;
        float top_y = 50.0f;
        float spread_x = 100.0f;
        float spread_y = 100.0f;
        float spread_z = 50.0f;
    };

    struct CameraParams
    {
        float fov_y_degrees = 75.0f;
        float aspect = 16.0f / 9.0f;
        float znear = 0.1f;
        float zfar = 1000.0f;
        double transition_step = 0.02;
        ViewId start_view = ViewId::Default;
    };

    struct DeathParams
    {
        float offset_distance = 15.0f;
        float slow_factor = 0.2f;
        double camera_step = 0.02;
        double game_over_notice_delay_ms = 2000.0;
    };

    struct GameConfig
    {
        uint32_t seed = 0; // 0 = seed from std::random_device
        double tick_ms = 1000.0 / 60.0;

        PlayerParams player{};
        ProjectileParams projectile{};
        ObstacleParams obstacle{};
        DifficultyParams difficulty{};
        StarParams stars{};
        CameraParams camera{};
        DeathParams death{};
    };

    // Clamps values that would stall a blend, divide by zero or invert a range.
    // Returns one message per repaired field.
    inline std::vector<std::string> validate_config(GameConfig& cfg)
    {
        std::vector<std::string> fixes{};
        auto fix = [&](bool bad, const char* what, auto& field, auto value) {
            if (!bad) return;
            field = value;
            fixes.emplace_back(what);
        };

        fix(!(cfg.tick_ms > 0.0), "tick_ms must be > 0", cfg.tick_ms, 1000.0 / 60.0);
        fix(!(cfg.camera.transition_step > 0.0), "camera.transition_step must be > 0", cfg.camera.transition_step, 0.02);
        fix(!(cfg.death.camera_step > 0.0), "death.camera_step must be > 0", cfg.death.camera_step, 0.02);
        fix(cfg.death.game_over_notice_delay_ms < 0.0, "death.game_over_notice_delay_ms must be >= 0",
            cfg.death.game_over_notice_delay_ms, 0.0);
        fix(cfg.difficulty.max_difficulty_score < 0, "difficulty.max_difficulty_score must be >= 0",
            cfg.difficulty.max_difficulty_score, 0);
        fix(cfg.difficulty.max_obstacles < 1, "difficulty.max_obstacles must be >= 1", cfg.difficulty.max_obstacles, 1);
        fix(cfg.difficulty.score_per_extra_obstacle < 1, "difficulty.score_per_extra_obstacle must be >= 1",
            cfg.difficulty.score_per_extra_obstacle, 10);
        fix(!(cfg.difficulty.min_spawn_delay_ms > 0.0), "difficulty.min_spawn_delay_ms must be > 0",
            cfg.difficulty.min_spawn_delay_ms, 300.0);
        fix(cfg.obstacle.size_max < cfg.obstacle.size_min, "obstacle.size_max must be >= size_min",
            cfg.obstacle.size_max, cfg.obstacle.size_min);
        fix(!(cfg.obstacle.rotation_score_divisor > 0.0f), "obstacle.rotation_score_divisor must be > 0",
            cfg.obstacle.rotation_score_divisor, 50.0f);
        fix(!(cfg.obstacle.scale_far_distance > cfg.obstacle.scale_near_distance),
            "obstacle.scale_far_distance must exceed scale_near_distance",
            cfg.obstacle.scale_far_distance, cfg.obstacle.scale_near_distance + 1.0f);
        fix(cfg.stars.count < 0, "stars.count must be >= 0", cfg.stars.count, 0);
        fix(!(cfg.camera.aspect > 0.0f), "camera.aspect must be > 0", cfg.camera.aspect, 16.0f / 9.0f);
        fix(!(cfg.player.rapid_fire_interval_ms > 0.0), "player.rapid_fire_interval_ms must be > 0",
            cfg.player.rapid_fire_interval_ms, 100.0);
        return fixes;
    }
}
