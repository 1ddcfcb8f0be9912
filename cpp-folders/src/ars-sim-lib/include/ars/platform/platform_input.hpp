#pragma once

/*
    ARS SIM LIB

    FILE: platform_input.hpp
    MODULE: platform
    PURPOSE: Per-poll input gathered by a platform runtime: window commands plus the
            ordered gameplay intents for Game::handle_input().
*/


#include <vector>

#include "ars/input/input_latch.hpp"

namespace ars
{
    struct PlatformInputState
    {
        bool quit = false;
        bool toggle_pause = false;
        std::vector<InputEvent> events{};
    };
}
