#pragma once

/*
    ARS SIM LIB

    FILE: convention.hpp
    MODULE: camera
    PURPOSE: Right-handed camera convention shared by the rig, the frustum bound and the demo
            renderer. Cameras look down their local -Z axis, NDC Z is in [-1, 1].
*/


#include <cmath>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace ars
{
    inline const glm::vec3 kWorldUp{0.0f, 1.0f, 0.0f};

    // Right-handed (RH) perspective projection with NDC Z in [-1, 1].
    inline glm::mat4 perspective_rh_no(float fovy_radians, float aspect, float znear, float zfar)
    {
        return glm::perspectiveRH_NO(fovy_radians, aspect, znear, zfar);
    }

    // Camera-to-world basis whose -Z column points from eye to target. When up is
    // parallel to the view direction the forward axis is nudged so the basis
    // stays well defined (top-down views).
    inline glm::mat3 look_basis_rh(const glm::vec3& eye, const glm::vec3& target, const glm::vec3& up = kWorldUp)
    {
        glm::vec3 z = eye - target;
        if (glm::dot(z, z) == 0.0f) z.z = 1.0f;
        z = glm::normalize(z);

        glm::vec3 x = glm::cross(up, z);
        if (glm::dot(x, x) == 0.0f)
        {
            if (std::abs(up.z) == 1.0f) z.x += 0.0001f;
            else z.z += 0.0001f;
            z = glm::normalize(z);
            x = glm::cross(up, z);
        }
        x = glm::normalize(x);
        const glm::vec3 y = glm::cross(z, x);
        return glm::mat3(x, y, z);
    }
}
