#pragma once

/*
    ARS SIM LIB

    FILE: invariant.hpp
    MODULE: core
    PURPOSE: Invariant checks that stop a debug build at the faulty frame and
            repair the value in a release build so the frame loop keeps running.
*/


#include <cassert>
#include <cmath>
#include <string>

#include <glm/glm.hpp>

#include "ars/core/log.hpp"

#ifndef NDEBUG
#define ARS_INVARIANT(cond, msg) assert((cond) && (msg))
#else
#define ARS_INVARIANT(cond, msg)                                    \
    do                                                              \
    {                                                               \
        if (!(cond)) ::ars::log_error(std::string("invariant: ") + (msg)); \
    } while (0)
#endif

namespace ars
{
    inline bool is_finite(const glm::vec3& v)
    {
        return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
    }

    // Returns true when v had to be replaced.
    inline bool repair_non_finite(glm::vec3& v, const glm::vec3& fallback, const char* what)
    {
        if (is_finite(v)) return false;
        ARS_INVARIANT(false, what);
        log_warn(std::string("non-finite ") + what + " replaced with last good value");
        v = fallback;
        return true;
    }

    inline int repair_negative(int value, const char* what)
    {
        if (value >= 0) return value;
        ARS_INVARIANT(false, what);
        log_warn(std::string("negative ") + what + " clamped to 0");
        return 0;
    }
}
