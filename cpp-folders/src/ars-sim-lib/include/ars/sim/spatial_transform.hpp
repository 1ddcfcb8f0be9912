#pragma once

/*
    ARS SIM LIB

    FILE: spatial_transform.hpp
    MODULE: sim
    PURPOSE: Position / velocity / scale / orientation state shared by every entity and
            the world bounding box derived from it.
*/


#include <glm/glm.hpp>

#include "ars/camera/camera_math.hpp"
#include "ars/geometry/aabb.hpp"

namespace ars
{
    struct SpatialTransform
    {
        glm::vec3 pos{0.0f};
        glm::vec3 vel{0.0f};
        glm::vec3 scl{1.0f};
        glm::vec3 rot_euler{0.0f}; // radians, XYZ order

        // One explicit Euler step per tick, no sub-stepping.
        void integrate()
        {
            pos += vel;
        }

        glm::mat3 rotation() const
        {
            return mat3_from_euler_xyz(rot_euler);
        }

        glm::mat4 model() const
        {
            glm::mat4 m = glm::mat4(rotation());
            m[0] *= scl.x;
            m[1] *= scl.y;
            m[2] *= scl.z;
            m[3] = glm::vec4(pos, 1.0f);
            return m;
        }
    };

    // World AABB of a local box centered on the transform origin.
    inline AABB world_aabb(const SpatialTransform& t, const glm::vec3& half_local)
    {
        return aabb_from_oriented_box(t.pos, t.rotation(), half_local * t.scl);
    }
}
