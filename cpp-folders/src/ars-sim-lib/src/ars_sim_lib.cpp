/*
    ARS SIM LIB

    FILE: ars_sim_lib.cpp
    MODULE: ars-sim-lib
    PURPOSE: Compiled library target anchor translation unit.
*/

#include "ars/app/game_session.hpp"
#include "ars/config/env_config.hpp"

namespace ars
{
    int ars_sim_compiled_target_anchor()
    {
        return 0;
    }
}
