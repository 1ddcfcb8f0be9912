#pragma once

/*
    ARS SIM LIB

    FILE: difficulty.hpp
    MODULE: sim
    PURPOSE: Score-driven spawn policy. Every value depends on the capped score only, so
            difficulty plateaus once the cap is reached.
*/


#include <algorithm>

#include "ars/config/game_config.hpp"

namespace ars
{
    struct DifficultyLevel
    {
        int capped_score = 0;
        int num_obstacles = 1;
        double spawn_delay_ms = 1000.0;
        float obstacle_speed = 0.2f;
        float rotation_scale = 1.0f;
    };

    inline int capped_score(int score, const DifficultyParams& p)
    {
        return std::clamp(score, 0, std::max(0, p.max_difficulty_score));
    }

    inline int num_obstacles(int score, const DifficultyParams& p)
    {
        const int capped = capped_score(score, p);
        return std::min(1 + capped / std::max(1, p.score_per_extra_obstacle), p.max_obstacles);
    }

    inline double spawn_delay_ms(int score, const DifficultyParams& p)
    {
        const int capped = capped_score(score, p);
        return std::max(p.min_spawn_delay_ms, p.base_spawn_delay_ms - (double)capped * p.spawn_delay_per_score_ms);
    }

    inline DifficultyLevel difficulty_for(int score, const GameConfig& cfg)
    {
        const ObstacleParams& op = cfg.obstacle;

        DifficultyLevel out{};
        out.capped_score = capped_score(score, cfg.difficulty);
        out.num_obstacles = num_obstacles(score, cfg.difficulty);
        out.spawn_delay_ms = spawn_delay_ms(score, cfg.difficulty);
        out.obstacle_speed = (op.base_speed + (float)out.capped_score * op.speed_per_score) * op.speed_multiplier;
        out.rotation_scale = 1.0f + (float)out.capped_score / op.rotation_score_divisor;
        return out;
    }
}
