#pragma once

/*
    ARS SIM LIB

    FILE: platform_runtime.hpp
    MODULE: platform
    PURPOSE: Window / input / present abstraction for the demo host.
*/


#include <cstdint>
#include <string>

#include "ars/platform/platform_input.hpp"

namespace ars
{
    struct WindowDesc
    {
        std::string title{};
        int width = 1280;
        int height = 720;
    };

    struct SurfaceDesc
    {
        int width = 640;
        int height = 360;
    };

    class IPlatformRuntime
    {
    public:
        virtual ~IPlatformRuntime() = default;

        virtual bool valid() const = 0;
        virtual bool pump_input(PlatformInputState& out) = 0;
        virtual uint64_t ticks_ms() const = 0;
        virtual void set_title(const std::string& title) = 0;
        virtual void upload_rgba8(const uint8_t* src, int width, int height, int src_pitch_bytes) = 0;
        virtual void present() = 0;
    };
}
