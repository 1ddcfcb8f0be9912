#pragma once

/*
    ARS SIM LIB

    FILE: aabb.hpp
    MODULE: geometry
    PURPOSE: Axis-aligned bounding box, its construction from a rotated and scaled
            local box, and the overlap test used by collision resolution.
*/

#include <glm/glm.hpp>
#include <algorithm>
#include <cmath>

namespace ars {

struct AABB {
    glm::vec3 minv{  1e30f };
    glm::vec3 maxv{ -1e30f };

    inline void expand(const glm::vec3& p) {
        minv = glm::min(minv, p);
        maxv = glm::max(maxv, p);
    }

    inline bool empty() const {
        return minv.x > maxv.x || minv.y > maxv.y || minv.z > maxv.z;
    }

    inline glm::vec3 center() const { return 0.5f * (minv + maxv); }
    inline glm::vec3 extent() const { return 0.5f * (maxv - minv); }
};

inline AABB aabb_from_center_extent(const glm::vec3& c, const glm::vec3& half) {
    AABB b{};
    b.minv = c - half;
    b.maxv = c + half;
    return b;
}

// World box of a centered local box under rotation `r` (columns = local axes)
// and per-axis scale: every world half extent is the sum of the projected
// scaled local half extents.
inline AABB aabb_from_oriented_box(const glm::vec3& center, const glm::mat3& r, const glm::vec3& half_local) {
    glm::vec3 half{0.0f};
    for (int axis = 0; axis < 3; ++axis) {
        half += glm::abs(r[axis]) * half_local[axis];
    }
    return aabb_from_center_extent(center, half);
}

// Inclusive bounds, so touching boxes overlap. The test only compares a
// against b and b against a with the same operators, which keeps it symmetric.
inline bool intersects_aabb(const AABB& a, const AABB& b) {
    if (a.empty() || b.empty()) return false;
    return a.minv.x <= b.maxv.x && b.minv.x <= a.maxv.x &&
           a.minv.y <= b.maxv.y && b.minv.y <= a.maxv.y &&
           a.minv.z <= b.maxv.z && b.minv.z <= a.maxv.z;
}

} // namespace ars
