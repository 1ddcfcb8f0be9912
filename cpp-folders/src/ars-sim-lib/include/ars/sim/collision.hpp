#pragma once

/*
    ARS SIM LIB

    FILE: collision.hpp
    MODULE: sim
    PURPOSE: Pairwise overlap tests on world AABBs. Obstacles test with their hitbox
            sphere, never with the larger visual volume.
*/


#include "ars/geometry/aabb.hpp"
#include "ars/geometry/volumes.hpp"
#include "ars/sim/entities.hpp"

namespace ars
{
    inline bool intersects(const AABB& a, const AABB& b)
    {
        return intersects_aabb(a, b);
    }

    // Local hull + fins box, rotated with the craft's tilt and scaled.
    inline AABB player_box(const Player& p)
    {
        return world_aabb(p.tr, p.half_extents);
    }

    // The hitbox is a sphere, so its box ignores the visual spin.
    inline AABB obstacle_hit_box(const Obstacle& o)
    {
        return aabb_from_sphere(Sphere{o.hitbox.pos, o.hitbox_radius * o.hitbox.scl.x});
    }

    inline AABB projectile_box(const Projectile& p)
    {
        return aabb_from_sphere(Sphere{p.tr.pos, p.radius * p.tr.scl.x});
    }

    inline bool player_hits(const Player& p, const Obstacle& o)
    {
        return intersects(player_box(p), obstacle_hit_box(o));
    }

    inline bool projectile_hits(const Projectile& p, const Obstacle& o)
    {
        return intersects(projectile_box(p), obstacle_hit_box(o));
    }
}
