#pragma once

/*
    ARS SIM LIB

    FILE: env_config.hpp
    MODULE: config
    PURPOSE: ARS_* environment overrides for GameConfig and the log threshold.
*/


#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>

#include "ars/camera/view_presets.hpp"
#include "ars/config/game_config.hpp"
#include "ars/core/log.hpp"
#include "ars/core/result.hpp"

namespace ars
{
    inline bool parse_env_bool(const char* value, bool fallback)
    {
        if (!value || *value == '\0') return fallback;
        std::string v(value);
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (v == "1" || v == "true" || v == "on" || v == "yes") return true;
        if (v == "0" || v == "false" || v == "off" || v == "no") return false;
        return fallback;
    }

    inline uint32_t parse_env_u32(const char* value, uint32_t fallback, uint32_t min_value = 0u)
    {
        if (!value || *value == '\0') return fallback;
        char* end = nullptr;
        const unsigned long parsed = std::strtoul(value, &end, 10);
        if (end == value) return fallback;
        const uint32_t out = static_cast<uint32_t>(std::min<unsigned long>(
            parsed,
            static_cast<unsigned long>(std::numeric_limits<uint32_t>::max())));
        return std::max(min_value, out);
    }

    inline Result<LogLevel> parse_log_level(const std::string& name)
    {
        std::string v = name;
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (v == "debug") return Result<LogLevel>::success(LogLevel::Debug);
        if (v == "info") return Result<LogLevel>::success(LogLevel::Info);
        if (v == "warn" || v == "warning") return Result<LogLevel>::success(LogLevel::Warn);
        if (v == "error") return Result<LogLevel>::success(LogLevel::Error);
        if (v == "off" || v == "none") return Result<LogLevel>::success(LogLevel::Off);
        return Result<LogLevel>::failure("unknown log level '" + name + "'");
    }

    inline void apply_env_overrides(GameConfig& cfg)
    {
        cfg.seed = parse_env_u32(std::getenv("ARS_SEED"), cfg.seed);
        cfg.player.start_shield = parse_env_bool(std::getenv("ARS_SHIELD"), cfg.player.start_shield);
        cfg.player.start_rapid_fire = parse_env_bool(std::getenv("ARS_RAPID_FIRE"), cfg.player.start_rapid_fire);
        const uint32_t max_score = parse_env_u32(
            std::getenv("ARS_MAX_DIFFICULTY_SCORE"),
            (uint32_t)std::max(0, cfg.difficulty.max_difficulty_score));
        cfg.difficulty.max_difficulty_score =
            (int)std::min<uint32_t>(max_score, (uint32_t)std::numeric_limits<int>::max());

        if (const char* view = std::getenv("ARS_START_VIEW"); view && *view)
        {
            const Result<ViewId> parsed = parse_view_id(view);
            if (parsed) cfg.camera.start_view = parsed.value;
            else log_warn("ARS_START_VIEW: " + parsed.error);
        }

        if (const char* level = std::getenv("ARS_LOG_LEVEL"); level && *level)
        {
            const Result<LogLevel> parsed = parse_log_level(level);
            if (parsed) set_log_level(parsed.value);
            else log_warn("ARS_LOG_LEVEL: " + parsed.error);
        }
    }
}
