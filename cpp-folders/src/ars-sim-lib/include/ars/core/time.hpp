#pragma once

/*
    ARS SIM LIB

    FILE: time.hpp
    MODULE: core
    PURPOSE: Host clock helpers. FrameClock turns raw counter ticks into seconds,
            FixedStepClock turns elapsed seconds into whole simulation ticks.
*/


#include <algorithm>
#include <cstdint>

namespace ars
{
    struct FrameClock
    {
        uint64_t ticks_prev = 0;
        double tick_hz = 1.0;

        float begin_frame(uint64_t ticks_now)
        {
            if (ticks_prev == 0)
            {
                ticks_prev = ticks_now;
                return 0.0f;
            }
            const float dt = (float)((double)(ticks_now - ticks_prev) / tick_hz);
            ticks_prev = ticks_now;
            return dt;
        }
    };

    // Simulation constants are expressed per tick, so the host accumulates real
    // time and releases it in fixed slices. A long stall is capped at
    // max_steps_per_frame so the loop never spirals.
    struct FixedStepClock
    {
        double step_seconds = 1.0 / 60.0;
        int max_steps_per_frame = 5;
        double accumulator = 0.0;

        int consume(float dt_seconds)
        {
            if (step_seconds <= 0.0) return 0;
            accumulator += std::max(0.0, (double)dt_seconds);

            int steps = 0;
            while (accumulator >= step_seconds && steps < max_steps_per_frame)
            {
                accumulator -= step_seconds;
                ++steps;
            }
            if (steps == max_steps_per_frame)
            {
                accumulator = std::min(accumulator, step_seconds);
            }
            return steps;
        }

        void reset()
        {
            accumulator = 0.0;
        }
    };
}
