/*
 * File: tests/test_http.cpp
 * Project: TTB Broker Proxy
 * Purpose: URL parsing and form encoding
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include "ttb_http.hpp"

TEST_CASE("parse_url fills in default ports and paths")
{
    auto u = parse_url("https://lab1.example.com");
    REQUIRE(u.scheme == "https");
    REQUIRE(u.host == "lab1.example.com");
    REQUIRE(u.port == "443");
    REQUIRE(u.path == "/");
    REQUIRE(u.origin() == "https://lab1.example.com");

    u = parse_url("HTTP://user:pw@10.0.0.1:5000/ttb-v1/targets/");
    REQUIRE(u.scheme == "http");
    REQUIRE(u.host == "10.0.0.1");
    REQUIRE(u.port == "5000");
    REQUIRE(u.path == "/ttb-v1/targets/");
    REQUIRE(u.origin() == "http://10.0.0.1:5000");
}

TEST_CASE("parse_url handles IPv6 literals")
{
    auto u = parse_url("https://[fd00::1]:5000/x");
    REQUIRE(u.host == "fd00::1");
    REQUIRE(u.port == "5000");
    REQUIRE(u.origin() == "https://[fd00::1]:5000");
}

TEST_CASE("parse_url rejects what it cannot use")
{
    REQUIRE_THROWS_AS(parse_url("lab1.example.com"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_url("ftp://lab1"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_url("https://"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_url("https://[fd00::1"), std::runtime_error);
}

TEST_CASE("default alias is the short host name")
{
    REQUIRE(default_aka("https://lab1.example.com:5000") == "lab1");
    REQUIRE(default_aka("http://localhost") == "localhost");
}

TEST_CASE("form encoding")
{
    REQUIRE(form_encode({{"email", "a@b.c"}, {"password", "p w&="}}) == "email=a%40b.c&password=p+w%26%3D");
    REQUIRE(form_encode({{"projection", R"(["id"])"}}) == "projection=%5B%22id%22%5D");
    REQUIRE(form_encode({}).empty());
}

TEST_CASE("path segments keep spaces as %20")
{
    REQUIRE(url_encode("a b/c", false) == "a%20b%2Fc");
    REQUIRE(url_encode("a b/c") == "a+b%2Fc");
}
