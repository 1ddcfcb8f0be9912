#pragma once

/*
    ARS SIM LIB

    FILE: volumes.hpp
    MODULE: geometry
    PURPOSE: Plane, sphere and frustum primitives used by the camera bound and
            the hitbox volumes.
*/

#include <array>

#include <glm/glm.hpp>

#include "ars/geometry/aabb.hpp"

namespace ars
{
    struct Plane
    {
        glm::vec3 normal{0.0f, 1.0f, 0.0f};
        float d = 0.0f; // plane eq: dot(normal, x) + d = 0

        inline float signed_distance(const glm::vec3& p) const
        {
            return glm::dot(normal, p) + d;
        }
    };

    struct Sphere
    {
        glm::vec3 center{0.0f};
        float radius = 0.0f;
    };

    struct Frustum
    {
        std::array<Plane, 6> planes{};
    };

    inline AABB aabb_from_sphere(const Sphere& s)
    {
        const float r = glm::max(s.radius, 0.0f);
        return aabb_from_center_extent(s.center, glm::vec3(r));
    }
}
