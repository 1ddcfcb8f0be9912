#pragma once

/*
    ARS SIM LIB

    FILE: frustum.hpp
    MODULE: geometry
    PURPOSE: Extracts the six frustum planes from a view-projection matrix and
            answers point containment for the player movement bound.
*/

#include <cstddef>
#include <cstdint>

#include <glm/glm.hpp>

#include "ars/geometry/volumes.hpp"

namespace ars
{
    enum class FrustumPlane : uint32_t
    {
        Left = 0,
        Right = 1,
        Bottom = 2,
        Top = 3,
        Near = 4,
        Far = 5
    };

    inline Plane make_plane_from_vec4(const glm::vec4& eq)
    {
        Plane p{};
        const glm::vec3 n(eq.x, eq.y, eq.z);
        const float len = glm::length(n);
        if (len <= 1e-8f)
        {
            p.normal = glm::vec3(0.0f, 1.0f, 0.0f);
            p.d = eq.w;
            return p;
        }
        p.normal = n / len;
        p.d = eq.w / len;
        return p;
    }

    // Gribb/Hartmann extraction for an OpenGL style clip volume (z in [-w, w]).
    // glm stores columns, so row i is (m[0][i], m[1][i], m[2][i], m[3][i]).
    inline Frustum extract_frustum_planes(const glm::mat4& view_proj)
    {
        const glm::vec4 r0(view_proj[0][0], view_proj[1][0], view_proj[2][0], view_proj[3][0]);
        const glm::vec4 r1(view_proj[0][1], view_proj[1][1], view_proj[2][1], view_proj[3][1]);
        const glm::vec4 r2(view_proj[0][2], view_proj[1][2], view_proj[2][2], view_proj[3][2]);
        const glm::vec4 r3(view_proj[0][3], view_proj[1][3], view_proj[2][3], view_proj[3][3]);

        Frustum f{};
        f.planes[static_cast<size_t>(FrustumPlane::Left)] = make_plane_from_vec4(r3 + r0);
        f.planes[static_cast<size_t>(FrustumPlane::Right)] = make_plane_from_vec4(r3 - r0);
        f.planes[static_cast<size_t>(FrustumPlane::Bottom)] = make_plane_from_vec4(r3 + r1);
        f.planes[static_cast<size_t>(FrustumPlane::Top)] = make_plane_from_vec4(r3 - r1);
        f.planes[static_cast<size_t>(FrustumPlane::Near)] = make_plane_from_vec4(r3 + r2);
        f.planes[static_cast<size_t>(FrustumPlane::Far)] = make_plane_from_vec4(r3 - r2);
        return f;
    }

    inline bool frustum_contains_point(const Frustum& f, const glm::vec3& p)
    {
        for (const Plane& plane : f.planes)
        {
            if (plane.signed_distance(p) < 0.0f) return false;
        }
        return true;
    }

    template <typename TPoints>
    inline bool frustum_contains_all(const Frustum& f, const TPoints& points)
    {
        for (const glm::vec3& p : points)
        {
            if (!frustum_contains_point(f, p)) return false;
        }
        return true;
    }
}
