#pragma once

/*
    ARS SIM LIB

    FILE: star_field.hpp
    MODULE: sim
    PURPOSE: Background stars falling on y and wrapping back to the top.
*/


#include <cstddef>

#include <glm/glm.hpp>

#include "ars/config/game_config.hpp"
#include "ars/sim/game_state.hpp"

namespace ars
{
    inline void scatter_star(GameState& s, const StarParams& p, Star& star)
    {
        star.tr.pos.x = (random01(s) - 0.5f) * p.spread_x;
        star.tr.pos.y = (random01(s) - 0.5f) * p.spread_y;
        star.tr.pos.z = (random01(s) - 0.5f) * p.spread_z;
        star.tr.vel = glm::vec3(0.0f, -p.fall_speed, 0.0f);
    }

    inline void populate_star_field(GameState& s, const StarParams& p)
    {
        s.stars.clear();
        s.stars.resize((std::size_t)p.count);
        for (Star& star : s.stars) scatter_star(s, p, star);
    }

    // Below the floor a star re-enters at the top with fresh x / z.
    inline void step_star(GameState& s, const StarParams& p, Star& star)
    {
        star.tr.integrate();
        if (star.tr.pos.y < p.floor_y)
        {
            star.tr.pos.y = p.top_y;
            star.tr.pos.x = (random01(s) - 0.5f) * p.spread_x;
            star.tr.pos.z = (random01(s) - 0.5f) * p.spread_z;
        }
    }
}
