/*
 * File: src/ttb_session.hpp
 * Project: TTB Broker Proxy
 * Purpose: One authenticated session per remote broker
 * Notes:
 *  - See DESIGN.md
 *  - The cookie jar is the only mutable state shared between threads; guarded by mtx_
 *  - State files: <state_dir>/cookies-<safe url>.json, mode 0600
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "atomic_write.hpp"
#include "common/log.hpp"
#include "common/target.hpp"
#include "ttb_http.hpp"

namespace fs = std::filesystem;

using CookieJar = std::map<std::string, std::string>;
using Projection = std::vector<std::string>;

constexpr const char *kApiPrefix = "/ttb-v1/";
constexpr const char *kValidSessionStatus = "You have a valid session";
constexpr int kStateVersion = 1;
// target operations (flashing) can be slow
constexpr std::chrono::seconds kDefaultTimeout{480};

struct BrokerConfig
{
    std::string url;
    std::string aka; // defaults to the URL's host name sans domain
    TlsPolicy tls;
    std::chrono::seconds timeout{kDefaultTimeout};
};

enum class SessionValidity
{
    unknown,
    valid,
    invalid
};

// Result of an acquire: a broker refusing (target owned by someone
// else, no permission...) is an outcome, not an error
struct AcquireOutcome
{
    bool acquired = false;
    unsigned status = 0;
    std::string message;
    nlohmann::json reply;
};

inline std::string verb_name(http::verb v)
{
    auto s = http::to_string(v);
    return std::string(s.data(), s.size());
}

class BrokerSession
{
    const std::string url_;
    std::string aka_;
    std::string base_url_;
    std::chrono::seconds timeout_;
    std::shared_ptr<HttpTransport> transport_;

    mutable std::mutex mtx_;
    CookieJar cookies_;
    SessionValidity validity_ = SessionValidity::unknown;

public:
    explicit BrokerSession(const BrokerConfig &cfg, std::shared_ptr<HttpTransport> transport = nullptr)
        : url_(cfg.url), aka_(cfg.aka), timeout_(cfg.timeout), transport_(std::move(transport))
    {
        ParsedUrl u = parse_url(url_);
        if (aka_.empty())
            aka_ = default_aka(url_);
        base_url_ = u.origin() + kApiPrefix;
        if (!transport_)
            transport_ = std::make_shared<BeastTransport>(cfg.tls);
    }

    BrokerSession(const BrokerSession &) = delete;
    BrokerSession &operator=(const BrokerSession &) = delete;

    const std::string &url() const { return url_; }
    const std::string &aka() const { return aka_; }
    const std::string &base_url() const { return base_url_; }

    CookieJar cookies() const
    {
        std::scoped_lock lk(mtx_);
        return cookies_;
    }

    void set_cookies(CookieJar jar)
    {
        std::scoped_lock lk(mtx_);
        cookies_ = std::move(jar);
    }

    SessionValidity validity() const
    {
        std::scoped_lock lk(mtx_);
        return validity_;
    }

    // Issues one call against <origin>/ttb-v1/<path>, merges the reply's
    // cookies and returns the decoded JSON body. Non-2xx replies raise
    // BrokerError(remote_error) with the broker's `message` when present.
    nlohmann::json send_request(http::verb method, std::string path, const FormData &data = {})
    {
        if (!path.empty() && path.front() == '/')
            path.erase(0, 1);
        HttpRequest req;
        req.method = method;
        req.url = base_url_ + path;
        req.form = data;
        req.timeout = timeout_;
        req.cookie = cookie_header();
        ttb_log().debug("send_request: {} {}", verb_name(method), req.url);

        HttpResponse res = transport_->send(req);
        merge_cookies(res.set_cookie);
        if (!res.ok())
            throw remote_error(res);

        auto body = nlohmann::json::parse(res.body, nullptr, false);
        if (body.is_discarded())
            throw BrokerError(ErrorKind::remote_error, url_ + ": reply is not JSON", res.status);
        log_diagnostics(body);
        return body;
    }

    // GET targets/; includes disabled targets only if asked to
    std::vector<TargetDescriptor> list_targets(bool include_disabled, const Projection &projection = {})
    {
        FormData data;
        if (!projection.empty())
            data.emplace_back("projection", nlohmann::json(projection).dump());
        auto r = send_request(http::verb::get, "targets/", data);
        return targets_from_reply(r, include_disabled);
    }

    // GET targets/<id>; some brokers reply with the bare descriptor
    TargetDescriptor describe_target(const std::string &id)
    {
        auto r = send_request(http::verb::get, "targets/" + url_encode(id, false));
        if (r.is_object() && !r.contains("targets"))
            r = nlohmann::json{{"targets", nlohmann::json::array({r})}};
        auto targets = targets_from_reply(r, true);
        for (auto &t : targets)
            if (t.id == id)
                return std::move(t);
        throw BrokerError(ErrorKind::not_found, aka_ + "/" + id + ": unknown target");
    }

    // false on bad credentials (HTTP 404); other broker errors propagate
    bool login(const std::string &user, const std::string &password)
    {
        try
        {
            send_request(http::verb::put, "login", {{"email", user}, {"password", password}});
        }
        catch (const BrokerError &e)
        {
            if (e.kind() != ErrorKind::remote_error || e.status() != 404)
                throw;
            ttb_log().error("{}: login failed: {}", url_, e.what());
            std::scoped_lock lk(mtx_);
            validity_ = SessionValidity::invalid;
            return false;
        }
        std::scoped_lock lk(mtx_);
        validity_ = SessionValidity::valid;
        return true;
    }

    void logout()
    {
        send_request(http::verb::get, "logout");
        std::scoped_lock lk(mtx_);
        validity_ = SessionValidity::invalid;
    }

    // Cached until `force`; an unreachable broker leaves the cache alone
    bool validate_session(bool force = false)
    {
        {
            std::scoped_lock lk(mtx_);
            if (validity_ != SessionValidity::unknown && !force)
                return validity_ == SessionValidity::valid;
        }
        bool valid = false;
        try
        {
            auto r = send_request(http::verb::get, "validate_session");
            auto status = r.find("status");
            valid = r.is_object() && status != r.end() && status->is_string() && *status == kValidSessionStatus;
        }
        catch (const BrokerError &e)
        {
            if (e.kind() != ErrorKind::remote_error)
                throw;
        }
        std::scoped_lock lk(mtx_);
        validity_ = valid ? SessionValidity::valid : SessionValidity::invalid;
        return valid;
    }

    AcquireOutcome acquire(const TargetDescriptor &target, const std::string &ticket = "", bool force = false)
    {
        check_owner(target);
        AcquireOutcome out;
        try
        {
            out.reply = send_request(http::verb::put, "targets/" + url_encode(target.id, false) + "/acquire",
                                     {{"ticket", ticket}, {"force", force ? "True" : "False"}});
            out.acquired = true;
            out.status = 200;
        }
        catch (const BrokerError &e)
        {
            if (e.kind() != ErrorKind::remote_error)
                throw;
            ttb_log().info("{}: acquire rejected: {}", target.fullid, e.what());
            out.status = e.status();
            out.message = e.what();
        }
        return out;
    }

    void release(const TargetDescriptor &target, const std::string &ticket = "", bool force = false)
    {
        check_owner(target);
        send_request(http::verb::put, "targets/" + url_encode(target.id, false) + "/release",
                     {{"force", force ? "True" : "False"}, {"ticket", ticket}});
    }

    void set_active(const TargetDescriptor &target, const std::string &ticket = "")
    {
        check_owner(target);
        send_request(http::verb::put, "targets/" + url_encode(target.id, false) + "/active", {{"ticket", ticket}});
    }

    fs::path state_file(const fs::path &state_dir) const
    {
        return state_dir / ("cookies-" + file_name_make_safe(url_) + ".json");
    }

    // Missing or corrupt state is not fatal: corrupt files are removed
    void load_state(const fs::path &state_dir)
    {
        auto file = state_file(state_dir);
        std::error_code ec;
        if (!fs::exists(file, ec))
        {
            ttb_log().debug("{}: no state-file, will not load", file.string());
            return;
        }
        std::string raw;
        CookieJar jar;
        if (!read_file_all(file, raw) || !decode_state(raw, jar))
        {
            ttb_log().warn("{}: invalid state, removing", file.string());
            fs::remove(file, ec);
            return;
        }
        set_cookies(std::move(jar));
        ttb_log().info("{}: loaded state", file.string());
    }

    void save_state(const fs::path &state_dir) const
    {
        auto file = state_file(state_dir);
        auto jar = cookies();
        std::error_code ec;
        if (jar.empty())
        {
            fs::remove(file, ec);
            ttb_log().debug("{}: state deleted (no cookies)", url_);
            return;
        }
        if (!fs::is_directory(state_dir, ec))
        {
            fs::create_directories(state_dir, ec);
            if (ec)
                throw std::runtime_error("create_directories failed: " + state_dir.string() + ": " + ec.message());
            ttb_log().warn("{}: created state storage directory", state_dir.string());
        }
        write_atomic(file, encode_state(jar), 0600);
        ttb_log().debug("{}: state saved ({} cookies)", url_, jar.size());
    }

    // Forget cookies so the next save_state() logs this user out locally
    void trash_state()
    {
        std::scoped_lock lk(mtx_);
        cookies_.clear();
        validity_ = SessionValidity::unknown;
    }

    std::string encode_state(const CookieJar &jar) const
    {
        nlohmann::json j{{"version", kStateVersion}, {"url", url_}, {"cookies", jar}};
        return j.dump(2);
    }

    static bool decode_state(const std::string &raw, CookieJar &jar)
    {
        auto j = nlohmann::json::parse(raw, nullptr, false);
        if (j.is_discarded() || !j.is_object())
            return false;
        auto version = j.find("version");
        if (version == j.end() || !version->is_number_integer() || version->get<int>() != kStateVersion)
            return false;
        auto cookies = j.find("cookies");
        if (cookies == j.end() || !cookies->is_object())
            return false;
        jar.clear();
        for (auto it = cookies->begin(); it != cookies->end(); ++it)
        {
            if (!it.value().is_string())
                return false;
            jar[it.key()] = it.value().get<std::string>();
        }
        return true;
    }

private:
    std::string cookie_header() const
    {
        std::scoped_lock lk(mtx_);
        std::string h;
        for (const auto &[name, value] : cookies_)
        {
            if (!h.empty())
                h += "; ";
            h += name + "=" + value;
        }
        return h;
    }

    // new values overwrite old by name, the rest (remember_token...) stays
    void merge_cookies(const std::vector<std::string> &set_cookie)
    {
        if (set_cookie.empty())
            return;
        std::scoped_lock lk(mtx_);
        for (const auto &raw : set_cookie)
        {
            auto pair = raw.substr(0, raw.find(';'));
            auto eq = pair.find('=');
            if (eq == std::string::npos)
                continue;
            auto name = trim(pair.substr(0, eq));
            if (name.empty())
                continue;
            cookies_[name] = trim(pair.substr(eq + 1));
        }
    }

    static std::string trim(const std::string &s)
    {
        auto b = s.find_first_not_of(" \t");
        if (b == std::string::npos)
            return std::string();
        auto e = s.find_last_not_of(" \t");
        return s.substr(b, e - b + 1);
    }

    BrokerError remote_error(const HttpResponse &res) const
    {
        std::string message = "no specific error text available";
        auto j = nlohmann::json::parse(res.body, nullptr, false);
        if (j.is_object())
        {
            auto m = j.find("message");
            if (m != j.end() && m->is_string())
                message = m->get<std::string>();
        }
        ttb_log().debug("{}: HTTP error {}: {}", url_, res.status, res.body);
        return BrokerError(ErrorKind::remote_error, std::to_string(res.status) + ": " + message, res.status);
    }

    void log_diagnostics(const nlohmann::json &body) const
    {
        if (!body.is_object())
            return;
        auto d = body.find("diagnostics");
        if (d == body.end() || !d->is_string())
            return;
        const std::string text = d->get<std::string>();
        size_t start = 0;
        while (start < text.size())
        {
            auto nl = text.find('\n', start);
            auto line = text.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
            if (!line.empty())
                ttb_log().warn("diagnostics: {}", line);
            if (nl == std::string::npos)
                break;
            start = nl + 1;
        }
    }

    std::vector<TargetDescriptor> targets_from_reply(const nlohmann::json &r, bool include_disabled) const
    {
        auto list = r.find("targets");
        if (list == r.end() || !list->is_array())
            throw BrokerError(ErrorKind::remote_error, url_ + ": reply carries no target list");
        std::vector<TargetDescriptor> targets;
        targets.reserve(list->size());
        for (const auto &rt : *list)
        {
            try
            {
                auto t = target_from_json(rt, aka_);
                if (!include_disabled && t.disabled())
                    continue;
                targets.push_back(std::move(t));
            }
            catch (const BrokerError &e)
            {
                ttb_log().warn("{}: skipping target: {}", url_, e.what());
            }
        }
        return targets;
    }

    void check_owner(const TargetDescriptor &target) const
    {
        if (target.aka != aka_)
            throw std::invalid_argument(target.fullid + ": not served by broker " + aka_);
    }
};
