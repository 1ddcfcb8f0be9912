#pragma once

/*
    ARS SIM LIB

    FILE: follow_camera.hpp
    MODULE: camera
    PURPOSE: Per-tick easing of a camera position toward a target plus offset.
*/


#include <algorithm>
#include <glm/glm.hpp>

namespace ars
{
    // One fixed tick of exponential approach; factor 1 snaps, 0 holds.
    inline glm::vec3 follow_target(
        const glm::vec3& current,
        const glm::vec3& target_pos,
        const glm::vec3& offset_ws,
        float factor
    )
    {
        const float k = std::clamp(factor, 0.0f, 1.0f);
        const glm::vec3 desired = target_pos + offset_ws;
        return glm::mix(current, desired, k);
    }
}
