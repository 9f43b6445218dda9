/*
 * File: tests/test_log.cpp
 * Project: TTB Broker Proxy
 * Purpose: Process logger levels
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include "common/log.hpp"

TEST_CASE("logger is created once and shared by name")
{
    auto &a = ttb_log();
    REQUIRE(&a == &ttb_log());
    REQUIRE(spdlog::get("ttb").get() == &a);
}

TEST_CASE("level names are accepted, aliases included")
{
    set_log_level("debug");
    REQUIRE(ttb_log().level() == spdlog::level::debug);
    set_log_level("warning");
    REQUIRE(ttb_log().level() == spdlog::level::warn);
    set_log_level("err");
    REQUIRE(ttb_log().level() == spdlog::level::err);
    set_log_level("off");
    REQUIRE(ttb_log().level() == spdlog::level::off);
}

TEST_CASE("a mistyped level is rejected and leaves logging alone")
{
    set_log_level("warn");
    REQUIRE_THROWS_AS(set_log_level("verbose"), std::invalid_argument);
    REQUIRE_THROWS_AS(set_log_level(""), std::invalid_argument);
    REQUIRE(ttb_log().level() == spdlog::level::warn);
}
