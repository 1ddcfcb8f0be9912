#pragma once

/*
    ARS SIM LIB

    FILE: sim_context.hpp
    MODULE: sim
    PURPOSE: Non-owning bundle handed to every sub-system call.
*/


#include "ars/config/game_config.hpp"
#include "ars/logic/task_scheduler.hpp"
#include "ars/sim/game_events.hpp"
#include "ars/sim/game_state.hpp"
#include "ars/sim/visual_handle.hpp"

namespace ars
{
    struct SimContext
    {
        GameState* state = nullptr;
        TaskScheduler* tasks = nullptr;
        const GameConfig* config = nullptr;
        const GameEvents* events = nullptr;     // optional
        IVisualFactory* visuals = nullptr;      // optional

        bool valid() const { return state && tasks && config; }
    };
}
