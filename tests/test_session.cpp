/*
 * File: tests/test_session.cpp
 * Project: TTB Broker Proxy
 * Purpose: Broker session calls against a scripted transport
 * Last updated: 2026-10-18
 */

#include <thread>

#include <catch2/catch_all.hpp>
#include "fake_transport.hpp"
#include "ttb_session.hpp"

using nlohmann::json;

static BrokerConfig lab(const std::string &url = "https://lab1.example.com:5000/some/path", const std::string &aka = "")
{
    BrokerConfig c;
    c.url = url;
    c.aka = aka;
    return c;
}

static std::string form_value(const HttpRequest &req, const std::string &key)
{
    for (const auto &kv : req.form)
        if (kv.first == key)
            return kv.second;
    return "<absent>";
}

TEST_CASE("alias defaults to the host name and calls go under the API prefix")
{
    auto fake = std::make_shared<FakeTransport>(lister(json::array({{{"id", "t1"}}})));
    BrokerSession s(lab(), fake);
    REQUIRE(s.aka() == "lab1");
    REQUIRE(s.base_url() == "https://lab1.example.com:5000/ttb-v1/");

    auto targets = s.list_targets(true);
    REQUIRE(targets.size() == 1);
    REQUIRE(targets[0].fullid == "lab1/t1");
    auto reqs = fake->requests();
    REQUIRE(reqs[0].method == http::verb::get);
    REQUIRE(reqs[0].url == "https://lab1.example.com:5000/ttb-v1/targets/");
}

TEST_CASE("disabled targets are listed only on request")
{
    auto fake = std::make_shared<FakeTransport>(
        lister(json::array({{{"id", "t1"}}, {{"id", "t2"}, {"disabled", "broken cable"}}, {{"id", "t3"}, {"disabled", nullptr}}})));
    BrokerSession s(lab(), fake);
    REQUIRE(s.list_targets(false).size() == 2);
    REQUIRE(s.list_targets(true).size() == 3);
}

TEST_CASE("projection is sent JSON encoded")
{
    auto fake = std::make_shared<FakeTransport>(lister(json::array()));
    BrokerSession s(lab(), fake);
    s.list_targets(true, {"id", "owner"});
    REQUIRE(form_value(fake->requests()[0], "projection") == R"(["id","owner"])");
}

TEST_CASE("descriptors without an id are skipped, not fatal")
{
    auto fake = std::make_shared<FakeTransport>(lister(json::array({{{"type", "x"}}, {{"id", "ok"}}, "junk"})));
    BrokerSession s(lab(), fake);
    auto targets = s.list_targets(true);
    REQUIRE(targets.size() == 1);
    REQUIRE(targets[0].id == "ok");
}

TEST_CASE("non-2xx replies carry the broker's message and status")
{
    auto fake = std::make_shared<FakeTransport>([](const HttpRequest &)
                                                { return json_reply({{"message", "target busy"}}, 409); });
    BrokerSession s(lab(), fake);
    try
    {
        s.send_request(http::verb::get, "targets/");
        FAIL("no exception");
    }
    catch (const BrokerError &e)
    {
        REQUIRE(e.kind() == ErrorKind::remote_error);
        REQUIRE(e.status() == 409);
        REQUIRE(std::string(e.what()) == "409: target busy");
    }
}

TEST_CASE("error replies without a message get a default text")
{
    auto fake = std::make_shared<FakeTransport>([](const HttpRequest &)
                                                {
                                                    HttpResponse r;
                                                    r.status = 500;
                                                    r.body = "<html>oops</html>";
                                                    return r; });
    BrokerSession s(lab(), fake);
    REQUIRE_THROWS_WITH(s.send_request(http::verb::get, "x"), "500: no specific error text available");
}

TEST_CASE("cookies from replies are sent back, newest value wins")
{
    int n = 0;
    auto fake = std::make_shared<FakeTransport>([&n](const HttpRequest &)
                                                {
                                                    auto r = json_reply(json::object());
                                                    if (n++ == 0)
                                                        r.set_cookie = {"session=abc; Path=/; HttpOnly", "remember_token=r1"};
                                                    else
                                                        r.set_cookie = {"session=def"};
                                                    return r; });
    BrokerSession s(lab(), fake);
    s.send_request(http::verb::get, "a");
    s.send_request(http::verb::get, "b");
    s.send_request(http::verb::get, "c");
    auto reqs = fake->requests();
    REQUIRE(reqs[0].cookie.empty());
    REQUIRE(reqs[1].cookie == "remember_token=r1; session=abc");
    REQUIRE(reqs[2].cookie == "remember_token=r1; session=def");
}

TEST_CASE("login: 404 means bad credentials, other errors propagate")
{
    unsigned status = 404;
    auto fake = std::make_shared<FakeTransport>([&status](const HttpRequest &)
                                                { return json_reply({{"message", "nope"}}, status); });
    BrokerSession s(lab(), fake);
    REQUIRE_FALSE(s.login("me", "bad"));
    REQUIRE(s.validity() == SessionValidity::invalid);
    auto req = fake->requests()[0];
    REQUIRE(req.method == http::verb::put);
    REQUIRE(form_value(req, "email") == "me");
    REQUIRE(form_value(req, "password") == "bad");

    status = 500;
    REQUIRE_THROWS_AS(s.login("me", "bad"), BrokerError);

    status = 200;
    REQUIRE(s.login("me", "good"));
    REQUIRE(s.validity() == SessionValidity::valid);
}

TEST_CASE("validate_session checks the status text and caches the answer")
{
    std::string status = "You have a valid session";
    auto fake = std::make_shared<FakeTransport>([&status](const HttpRequest &)
                                                { return json_reply({{"status", status}}); });
    BrokerSession s(lab(), fake);
    REQUIRE(s.validate_session());
    status = "nope";
    REQUIRE(s.validate_session()); // cached
    REQUIRE(fake->calls.load() == 1);
    REQUIRE_FALSE(s.validate_session(true));
}

TEST_CASE("validate_session: unreachable propagates and leaves validity alone")
{
    auto fake = std::make_shared<FakeTransport>(unreachable());
    BrokerSession s(lab(), fake);
    REQUIRE_THROWS_AS(s.validate_session(), BrokerError);
    REQUIRE(s.validity() == SessionValidity::unknown);
}

TEST_CASE("acquire rejected by the broker is an outcome, unreachable is an error")
{
    auto t = target_from_json(json{{"id", "t1"}}, "lab1");
    auto busy = std::make_shared<FakeTransport>([](const HttpRequest &)
                                                { return json_reply({{"message", "t1: already acquired by alice"}}, 400); });
    BrokerSession s(lab(), busy);
    auto out = s.acquire(t);
    REQUIRE_FALSE(out.acquired);
    REQUIRE(out.status == 400);
    REQUIRE(out.message.find("alice") != std::string::npos);
    auto req = busy->requests()[0];
    REQUIRE(req.method == http::verb::put);
    REQUIRE(ends_with(req.url, "/ttb-v1/targets/t1/acquire"));
    REQUIRE(form_value(req, "force") == "False");

    BrokerSession down(lab(), std::make_shared<FakeTransport>(unreachable()));
    try
    {
        down.acquire(t, "", true);
        FAIL("no exception");
    }
    catch (const BrokerError &e)
    {
        REQUIRE(e.kind() == ErrorKind::unreachable);
    }
}

TEST_CASE("acquire with force and ticket, release and active")
{
    auto fake = std::make_shared<FakeTransport>([](const HttpRequest &) { return json_reply(json::object()); });
    BrokerSession s(lab(), fake);
    auto t = target_from_json(json{{"id", "t1"}}, "lab1");
    REQUIRE(s.acquire(t, "tk", true).acquired);
    s.release(t, "tk", true);
    s.set_active(t, "tk");
    auto reqs = fake->requests();
    REQUIRE(form_value(reqs[0], "force") == "True");
    REQUIRE(form_value(reqs[0], "ticket") == "tk");
    REQUIRE(ends_with(reqs[1].url, "targets/t1/release"));
    REQUIRE(ends_with(reqs[2].url, "targets/t1/active"));
}

TEST_CASE("operations on another broker's target are refused locally")
{
    auto fake = std::make_shared<FakeTransport>([](const HttpRequest &) { return json_reply(json::object()); });
    BrokerSession s(lab(), fake);
    auto t = target_from_json(json{{"id", "t1"}}, "lab2");
    REQUIRE_THROWS_AS(s.release(t), std::invalid_argument);
    REQUIRE(fake->calls.load() == 0);
}

TEST_CASE("describe_target accepts a bare descriptor")
{
    auto fake = std::make_shared<FakeTransport>([](const HttpRequest &req)
                                                {
                                                    if (ends_with(req.url, "targets/t1"))
                                                        return json_reply({{"id", "t1"}, {"owner", "bob"}});
                                                    return json_reply({{"message", "t9: not found"}}, 404); });
    BrokerSession s(lab(), fake);
    REQUIRE(s.describe_target("t1").owner() == "bob");
    REQUIRE_THROWS_AS(s.describe_target("t9"), BrokerError);
}

TEST_CASE("reply that is not JSON is a remote error")
{
    auto fake = std::make_shared<FakeTransport>([](const HttpRequest &)
                                                {
                                                    HttpResponse r;
                                                    r.status = 200;
                                                    r.body = "not json";
                                                    return r; });
    BrokerSession s(lab(), fake);
    REQUIRE_THROWS_AS(s.send_request(http::verb::get, "targets/"), BrokerError);
}

TEST_CASE("target ids are encoded as path segments")
{
    auto fake = std::make_shared<FakeTransport>([](const HttpRequest &) { return json_reply(json::object()); });
    BrokerSession s(lab(), fake);
    auto t = target_from_json(json{{"id", "odd id/../x?y"}}, "lab1");
    s.acquire(t);
    s.release(t);
    auto reqs = fake->requests();
    REQUIRE(reqs[0].url == "https://lab1.example.com:5000/ttb-v1/targets/odd%20id%2F..%2Fx%3Fy/acquire");
    REQUIRE(ends_with(reqs[1].url, "/targets/odd%20id%2F..%2Fx%3Fy/release"));
}

TEST_CASE("concurrent calls on one session merge cookies without tearing")
{
    constexpr int threads = 8;
    constexpr int rounds = 50;
    // each reply sets c<thread>=<round> and a shared cookie everyone overwrites
    auto fake = std::make_shared<FakeTransport>([](const HttpRequest &req)
                                                {
                                                    auto r = json_reply(json::object());
                                                    std::string t = form_value(req, "t");
                                                    std::string n = form_value(req, "n");
                                                    r.set_cookie = {"c" + t + "=" + n + "; Path=/", "shared=" + t + "-" + n};
                                                    return r; });
    BrokerSession s(lab(), fake);
    std::vector<std::thread> pool;
    for (int t = 0; t < threads; ++t)
        pool.emplace_back([&s, t]
                          {
                              for (int n = 0; n < rounds; ++n)
                                  s.send_request(http::verb::get, "x", {{"t", std::to_string(t)}, {"n", std::to_string(n)}}); });
    for (auto &th : pool)
        th.join();

    auto jar = s.cookies();
    REQUIRE(jar.size() == threads + 1);
    for (int t = 0; t < threads; ++t)
        REQUIRE(jar.at("c" + std::to_string(t)) == std::to_string(rounds - 1));
    REQUIRE(jar.at("shared").find('-') != std::string::npos);

    // every header sent was a well-formed list of name=value pairs
    auto reqs = fake->requests();
    REQUIRE(reqs.size() == threads * rounds);
    for (const auto &req : reqs)
    {
        std::size_t start = 0;
        while (start < req.cookie.size())
        {
            auto end = req.cookie.find("; ", start);
            auto pair = req.cookie.substr(start, end == std::string::npos ? std::string::npos : end - start);
            auto eq = pair.find('=');
            REQUIRE(eq != std::string::npos);
            REQUIRE(jar.count(pair.substr(0, eq)) == 1);
            if (end == std::string::npos)
                break;
            start = end + 2;
        }
    }
}
