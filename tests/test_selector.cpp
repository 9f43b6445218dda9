/*
 * File: tests/test_selector.cpp
 * Project: TTB Broker Proxy
 * Purpose: Target selection over BSP variants
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include "ttb_select.hpp"

using nlohmann::json;

namespace
{

TargetDescriptor two_bsps()
{
    return target_from_json(json{{"id", "ard-01"},
                                 {"type", "arduino101"},
                                 {"bsps", {{"x86", {{"zephyr_board", "qemu_x86"}}}, {"arm", {{"zephyr_board", "arduino_101"}}}}}},
                            "lab1");
}

TargetDescriptor plain(const std::string &id, json extra = json::object())
{
    extra["id"] = id;
    return target_from_json(extra, "lab1");
}

} // namespace

TEST_CASE("a target matches if any of its BSPs does")
{
    TargetSelector s("zephyr_board==\"arduino_101\"");
    REQUIRE(s.matches(two_bsps()));
    REQUIRE_FALSE(TargetSelector("zephyr_board == 'frdm_k64f'").matches(two_bsps()));
    REQUIRE(TargetSelector("bsp == 'arm' and zephyr_board : 'arduino'").matches(two_bsps()));
    REQUIRE_FALSE(TargetSelector("bsp == 'x86' and zephyr_board : 'arduino'").matches(two_bsps()));
}

TEST_CASE("BSP count is available to expressions")
{
    REQUIRE(TargetSelector("bsp_count == 2").matches(two_bsps()));
    REQUIRE(TargetSelector("bsp_count == 0").matches(plain("t1")));
}

TEST_CASE("without BSPs the base keywords are used once")
{
    auto t = plain("t1", {{"type", "qemu-x86"}, {"owner", "alice"}});
    REQUIRE(TargetSelector("type == 'qemu-x86' and owner == 'alice'").matches(t));
    REQUIRE_FALSE(TargetSelector("bsp == 'x86'").matches(t));
    REQUIRE(TargetSelector("t1").matches(t));
    REQUIRE(TargetSelector("lab1/t1").matches(t));
    REQUIRE_FALSE(TargetSelector("t2").matches(t));
}

TEST_CASE("empty spec selects everything")
{
    REQUIRE(TargetSelector("").matches(plain("t1", {{"disabled", "yes"}})));
}

TEST_CASE("spec composition excludes disabled targets unless asked")
{
    REQUIRE(compose_spec({}, false) == "( not disabled )");
    REQUIRE(compose_spec({}, true).empty());
    REQUIRE(compose_spec({"t1", "t2"}, true) == "(t1) or (t2)");
    REQUIRE(compose_spec({"t1"}, false) == "( not disabled ) and ( (t1) )");

    TargetTable table;
    for (auto t : {plain("t1"), plain("t2", {{"disabled", "broken"}}), plain("t3", {{"disabled", nullptr}})})
        table[t.fullid] = t;
    auto enabled = TargetSelector(compose_spec({}, false)).select(table);
    REQUIRE(enabled.size() == 2);
    REQUIRE(enabled[0].fullid == "lab1/t1");
    REQUIRE(enabled[1].fullid == "lab1/t3");
    REQUIRE(TargetSelector(compose_spec({"t2"}, true)).select(table).size() == 1);
    REQUIRE(TargetSelector(compose_spec({"t2"}, false)).select(table).empty());
}

TEST_CASE("a malformed spec fails the whole selection")
{
    REQUIRE_THROWS_AS(TargetSelector("type ==", "--target"), BrokerError);
}
