/*
 * File: tests/fake_transport.hpp
 * Project: TTB Broker Proxy
 * Purpose: Scripted HttpTransport for driving sessions without sockets
 * Last updated: 2026-10-18
 */

#pragma once
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ttb_http.hpp"

class FakeTransport : public HttpTransport
{
public:
    using Handler = std::function<HttpResponse(const HttpRequest &)>;

    explicit FakeTransport(Handler h) : handler_(std::move(h)) {}

    HttpResponse send(const HttpRequest &req) override
    {
        ++calls;
        {
            std::scoped_lock lk(mtx_);
            requests_.push_back(req);
        }
        return handler_(req);
    }

    std::vector<HttpRequest> requests() const
    {
        std::scoped_lock lk(mtx_);
        return requests_;
    }

    // requests whose URL ends with `suffix`
    int count(const std::string &suffix) const
    {
        std::scoped_lock lk(mtx_);
        int n = 0;
        for (const auto &r : requests_)
            if (r.url.size() >= suffix.size() && r.url.compare(r.url.size() - suffix.size(), suffix.size(), suffix) == 0)
                ++n;
        return n;
    }

    std::atomic<int> calls{0};

private:
    Handler handler_;
    mutable std::mutex mtx_;
    std::vector<HttpRequest> requests_;
};

inline HttpResponse json_reply(const nlohmann::json &body, unsigned status = 200)
{
    HttpResponse r;
    r.status = status;
    r.body = body.dump();
    return r;
}

inline bool ends_with(const std::string &s, const std::string &suffix)
{
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Serves GET targets/ from `targets`; anything else is a 404
inline FakeTransport::Handler lister(nlohmann::json targets)
{
    return [targets](const HttpRequest &req)
    {
        if (ends_with(req.url, "/targets/"))
            return json_reply({{"targets", targets}});
        return json_reply({{"message", "no such call"}}, 404);
    };
}

inline FakeTransport::Handler unreachable()
{
    return [](const HttpRequest &req) -> HttpResponse
    { throw BrokerError(ErrorKind::unreachable, req.url + ": Connection refused"); };
}
