#pragma once

/*
    ARS SIM LIB

    FILE: log.hpp
    MODULE: core
    PURPOSE: Level-filtered console logging shared by the simulation core and demo hosts.
*/


#include <atomic>
#include <iostream>
#include <string>

namespace ars
{
    enum class LogLevel : int
    {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3,
        Off = 4
    };

    inline std::atomic<int>& log_threshold()
    {
        static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
        return level;
    }

    inline void set_log_level(LogLevel level)
    {
        log_threshold().store(static_cast<int>(level));
    }

    inline LogLevel log_level()
    {
        return static_cast<LogLevel>(log_threshold().load());
    }

    inline bool log_enabled(LogLevel level)
    {
        return static_cast<int>(level) >= log_threshold().load();
    }

    inline const char* log_level_name(LogLevel level)
    {
        switch (level)
        {
            case LogLevel::Debug: return "debug";
            case LogLevel::Info: return "info";
            case LogLevel::Warn: return "warn";
            case LogLevel::Error: return "error";
            case LogLevel::Off: return "off";
        }
        return "info";
    }

    inline void log_debug(const std::string& msg)
    {
        if (!log_enabled(LogLevel::Debug)) return;
        std::cout << "[DEBUG] " << msg << std::endl;
    }

    inline void log_info(const std::string& msg)
    {
        if (!log_enabled(LogLevel::Info)) return;
        std::cout << "[INFO] " << msg << std::endl;
    }

    inline void log_warn(const std::string& msg)
    {
        if (!log_enabled(LogLevel::Warn)) return;
        std::cout << "[WARN] " << msg << std::endl;
    }

    inline void log_error(const std::string& msg)
    {
        if (!log_enabled(LogLevel::Error)) return;
        std::cerr << "[ERROR] " << msg << std::endl;
    }
}
