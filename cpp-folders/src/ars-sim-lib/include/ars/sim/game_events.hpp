#pragma once

/*
    ARS SIM LIB

    FILE: game_events.hpp
    MODULE: sim
    PURPOSE: Fire-and-forget notifications from the core to the presentation layer.
*/


#include <cstdint>
#include <functional>

#include <glm/glm.hpp>

#include "ars/camera/view_presets.hpp"

namespace ars
{
    enum class DestroyCause : uint8_t
    {
        PassedPlayer = 0,
        ShieldImpact = 1,
        ProjectileHit = 2
    };

    inline const char* destroy_cause_name(DestroyCause cause)
    {
        switch (cause)
        {
            case DestroyCause::PassedPlayer: return "passed_player";
            case DestroyCause::ShieldImpact: return "shield_impact";
            case DestroyCause::ProjectileHit: return "projectile_hit";
        }
        return "unknown";
    }

    // Any member may be left empty.
    struct GameEvents
    {
        std::function<void(const glm::vec3& pos, DestroyCause cause)> on_obstacle_destroyed{};
        std::function<void(int score)> on_score_changed{};
        std::function<void(const glm::vec3& player_pos)> on_death_started{};
        std::function<void(int final_score)> on_game_over{};
        std::function<void(ViewId view)> on_view_changed{};
    };

    inline void notify_obstacle_destroyed(const GameEvents* ev, const glm::vec3& pos, DestroyCause cause)
    {
        if (ev && ev->on_obstacle_destroyed) ev->on_obstacle_destroyed(pos, cause);
    }

    inline void notify_score_changed(const GameEvents* ev, int score)
    {
        if (ev && ev->on_score_changed) ev->on_score_changed(score);
    }

    inline void notify_death_started(const GameEvents* ev, const glm::vec3& player_pos)
    {
        if (ev && ev->on_death_started) ev->on_death_started(player_pos);
    }

    inline void notify_game_over(const GameEvents* ev, int final_score)
    {
        if (ev && ev->on_game_over) ev->on_game_over(final_score);
    }

    inline void notify_view_changed(const GameEvents* ev, ViewId view)
    {
        if (ev && ev->on_view_changed) ev->on_view_changed(view);
    }
}
