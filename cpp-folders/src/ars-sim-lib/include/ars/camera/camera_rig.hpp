#pragma once

/*
    ARS SIM LIB

    FILE: camera_rig.hpp
    MODULE: camera
    PURPOSE: Scene camera written by the view/death state machine and read by the player
            frustum bound and the external renderer.
*/


#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include "ars/camera/camera_math.hpp"
#include "ars/camera/convention.hpp"
#include "ars/geometry/frustum.hpp"

namespace ars
{
    struct CameraPose
    {
        glm::vec3 pos{0.0f};
        glm::vec3 rot_euler{0.0f};
    };

    struct CameraRig
    {
        glm::vec3 pos{0.0f, 0.0f, 20.0f};
        glm::vec3 rot_euler{0.0f};

        float fov_y_radians = glm::radians(75.0f);
        float aspect = 16.0f / 9.0f;
        float znear = 0.1f;
        float zfar = 1000.0f;

        CameraPose pose() const
        {
            return CameraPose{pos, rot_euler};
        }

        void set_pose(const CameraPose& p)
        {
            pos = p.pos;
            rot_euler = p.rot_euler;
        }

        void look_at(const glm::vec3& target)
        {
            rot_euler = look_rotation_euler(pos, target);
        }

        glm::mat3 rotation() const
        {
            return mat3_from_euler_xyz(rot_euler);
        }

        glm::vec3 forward() const
        {
            return -rotation()[2];
        }

        glm::mat4 world() const
        {
            glm::mat4 m = glm::mat4(rotation());
            m[3] = glm::vec4(pos, 1.0f);
            return m;
        }

        glm::mat4 view() const
        {
            return glm::inverse(world());
        }

        glm::mat4 proj() const
        {
            return perspective_rh_no(fov_y_radians, aspect, znear, zfar);
        }

        glm::mat4 viewproj() const
        {
            return proj() * view();
        }

        Frustum frustum() const
        {
            return extract_frustum_planes(viewproj());
        }
    };
}
