#pragma once

/*
    ARS SIM LIB

    FILE: camera_math.hpp
    MODULE: camera
    PURPOSE: Euler (XYZ order) <-> rotation matrix conversion and the scalar easing helpers
            used by view blends and the death camera.
*/


#include <algorithm>
#include <cmath>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

#include "ars/camera/convention.hpp"

namespace ars
{
    // R = Rx * Ry * Rz, applied to column vectors.
    inline glm::mat3 mat3_from_euler_xyz(const glm::vec3& e)
    {
        glm::mat4 m(1.0f);
        m = glm::rotate(m, e.x, glm::vec3(1.0f, 0.0f, 0.0f));
        m = glm::rotate(m, e.y, glm::vec3(0.0f, 1.0f, 0.0f));
        m = glm::rotate(m, e.z, glm::vec3(0.0f, 0.0f, 1.0f));
        return glm::mat3(m);
    }

    // Inverse of mat3_from_euler_xyz. glm indexes [column][row].
    inline glm::vec3 euler_xyz_from_mat3(const glm::mat3& m)
    {
        const float m11 = m[0][0];
        const float m12 = m[1][0];
        const float m13 = m[2][0];
        const float m22 = m[1][1];
        const float m23 = m[2][1];
        const float m32 = m[1][2];
        const float m33 = m[2][2];

        glm::vec3 e{0.0f};
        e.y = std::asin(std::clamp(m13, -1.0f, 1.0f));
        if (std::abs(m13) < 0.9999999f)
        {
            e.x = std::atan2(-m23, m33);
            e.z = std::atan2(-m12, m11);
        }
        else
        {
            e.x = std::atan2(m32, m22);
            e.z = 0.0f;
        }
        return e;
    }

    inline glm::vec3 euler_xyz_from_quat(const glm::quat& q)
    {
        return euler_xyz_from_mat3(glm::mat3_cast(q));
    }

    // Euler rotation that makes a camera at eye look at target.
    inline glm::vec3 look_rotation_euler(const glm::vec3& eye, const glm::vec3& target)
    {
        return euler_xyz_from_mat3(look_basis_rh(eye, target));
    }

    // Hermite ramp of x between lo and hi; 0 below lo, 1 above hi.
    inline double smoothstep(double x, double lo, double hi)
    {
        if (x <= lo) return 0.0;
        if (x >= hi) return 1.0;
        const double t = (x - lo) / (hi - lo);
        return t * t * (3.0 - 2.0 * t);
    }

    inline float lerp(float a, float b, float t)
    {
        return a + (b - a) * t;
    }
}
