#pragma once

/*
    ARS SIM LIB

    FILE: entities.hpp
    MODULE: sim
    PURPOSE: Gameplay records for the player craft, obstacles, projectiles and
            background stars.
*/


#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "ars/sim/spatial_transform.hpp"
#include "ars/sim/visual_handle.hpp"

namespace ars
{
    struct Player
    {
        SpatialTransform tr{};
        float speed = 0.2f;
        glm::vec3 half_extents{2.0f, 2.0f, 1.0f};
        bool shield = false;
        bool rapid_fire = false;
        float cockpit_opacity = 1.0f;

        VisualBinding visual{};
        VisualBinding cockpit{};
    };

    struct Obstacle
    {
        SpatialTransform tr{};
        SpatialTransform hitbox{}; // position mirrors tr, scale is a fraction of tr.scl
        float size = 1.0f;
        float hitbox_radius = 0.8f;
        float speed = 0.0f;
        glm::vec3 direction{0.0f, 0.0f, 1.0f};
        float rotation_speed = 0.0f;
        glm::vec3 rotation_axis{0.0f, 1.0f, 0.0f};
        glm::quat spin{1.0f, 0.0f, 0.0f, 0.0f};

        VisualBinding visual{};
    };

    struct Projectile
    {
        SpatialTransform tr{};
        float speed = 0.5f;
        float radius = 0.2f;

        VisualBinding visual{};
    };

    // Decorative only; drawn from the render snapshot, never collided.
    struct Star
    {
        SpatialTransform tr{};
    };
}
