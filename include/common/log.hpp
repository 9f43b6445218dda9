/*
 * File: include/common/log.hpp
 * Project: TTB Broker Proxy
 * Purpose: Process logger
 * Notes:
 *  - See DESIGN.md
 *  - stdout carries command output; logs go to stderr
 * Last updated: 2026-10-18
 */

#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

inline spdlog::logger &ttb_log()
{
    // function-local static: brokers are queried from several threads
    static std::shared_ptr<spdlog::logger> logger = []
    {
        auto l = spdlog::get("ttb");
        if (!l)
            l = spdlog::stderr_color_mt("ttb");
        return l;
    }();
    return *logger;
}

// Accepts spdlog level names ("debug", "warning", "err", ...); anything
// else throws instead of silently turning logging off
inline void set_log_level(const std::string &name)
{
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off")
        throw std::invalid_argument("unknown log level '" + name + "'");
    ttb_log().set_level(level);
}
