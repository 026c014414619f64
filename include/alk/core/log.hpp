#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: log.hpp
    MODULE: core
    PURPOSE: Tagged console logging with a process-wide level threshold.
*/


#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace alk
{
    enum class LogLevel : int
    {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3
    };

    inline LogLevel parse_log_level(std::string_view s, LogLevel fallback = LogLevel::Info)
    {
        if (s == "debug") return LogLevel::Debug;
        if (s == "info") return LogLevel::Info;
        if (s == "warn") return LogLevel::Warn;
        if (s == "error") return LogLevel::Error;
        return fallback;
    }

    inline LogLevel& log_level_ref()
    {
        static LogLevel level = []()
        {
            const char* env = std::getenv("ALK_LOG_LEVEL");
            return env ? parse_log_level(env) : LogLevel::Info;
        }();
        return level;
    }

    inline void set_log_level(LogLevel level)
    {
        log_level_ref() = level;
    }

    inline bool log_enabled(LogLevel level)
    {
        return static_cast<int>(level) >= static_cast<int>(log_level_ref());
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
        std::cerr << "[ERROR] " << msg << std::endl;
    }
}
