/*
 * File: src/ttb_config.hpp
 * Project: TTB Broker Proxy
 * Purpose: Broker list configuration and credentials
 * Notes:
 *  - See DESIGN.md
 *  - Config file is JSON; credentials come from the environment or the command line
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "atomic_write.hpp"
#include "common/target.hpp"
#include "ttb_session.hpp"

struct ProxyConfig
{
    fs::path state_dir;
    std::chrono::seconds timeout{kDefaultTimeout};
    std::vector<BrokerConfig> brokers;
};

struct Credentials
{
    std::string user;
    std::string password;
};

inline std::string env_or_empty(const std::string &name)
{
    const char *v = std::getenv(name.c_str());
    return v ? std::string(v) : std::string();
}

inline fs::path expand_home(const std::string &path)
{
    if (path.empty() || path.front() != '~')
        return path;
    auto home = env_or_empty("HOME");
    if (home.empty())
        return path;
    return home + path.substr(1);
}

inline fs::path default_state_dir() { return expand_home("~/.tcf"); }

inline fs::path default_config_path()
{
    auto env = env_or_empty("TTB_CONFIG");
    if (!env.empty())
        return expand_home(env);
    return default_state_dir() / "brokers.json";
}

inline BrokerConfig broker_config_from_json(const nlohmann::json &j, std::chrono::seconds timeout)
{
    if (!j.is_object() || !j.contains("url") || !j["url"].is_string())
        throw std::runtime_error("broker entry needs a \"url\" string: " + j.dump());
    BrokerConfig b;
    b.url = j["url"].get<std::string>();
    b.aka = j.value("aka", std::string());
    b.timeout = std::chrono::seconds(j.value("timeout_s", static_cast<long>(timeout.count())));
    auto ca = j.value("ca_path", std::string());
    if (j.value("ssl_ignore", false))
        b.tls.mode = TlsPolicy::Mode::skip;
    else if (!ca.empty())
    {
        b.tls.mode = TlsPolicy::Mode::ca_bundle;
        b.tls.ca_path = expand_home(ca).string();
    }
    return b;
}

inline ProxyConfig config_from_json(const nlohmann::json &j)
{
    if (!j.is_object())
        throw std::runtime_error("configuration must be a JSON object");
    ProxyConfig cfg;
    cfg.state_dir = expand_home(j.value("state_dir", default_state_dir().string()));
    cfg.timeout = std::chrono::seconds(j.value("timeout_s", static_cast<long>(kDefaultTimeout.count())));
    if (j.contains("brokers"))
    {
        if (!j["brokers"].is_array())
            throw std::runtime_error("\"brokers\" must be a list");
        for (const auto &b : j["brokers"])
            cfg.brokers.push_back(broker_config_from_json(b, cfg.timeout));
    }
    return cfg;
}

inline ProxyConfig load_config(const fs::path &path)
{
    std::string raw;
    if (!read_file_all(path, raw))
        throw std::runtime_error(path.string() + ": cannot read configuration");
    auto j = nlohmann::json::parse(raw, nullptr, false);
    if (j.is_discarded())
        throw std::runtime_error(path.string() + ": configuration is not valid JSON");
    return config_from_json(j);
}

// "URL[,AKA]" as given on the command line
inline BrokerConfig broker_config_from_arg(const std::string &arg, std::chrono::seconds timeout)
{
    BrokerConfig b;
    auto comma = arg.find(',');
    b.url = arg.substr(0, comma);
    if (comma != std::string::npos)
        b.aka = arg.substr(comma + 1);
    b.timeout = timeout;
    return b;
}

// TCF_USER/TCF_PASSWORD, overridden by TCF_USER_<aka>/TCF_PASSWORD_<aka>,
// overridden by the command line
inline Credentials resolve_credentials(const std::string &aka, const std::string &user_cmdline,
                                       const std::string &password_cmdline)
{
    Credentials c;
    c.user = env_or_empty("TCF_USER");
    c.password = env_or_empty("TCF_PASSWORD");
    auto user_aka = env_or_empty("TCF_USER_" + aka);
    auto password_aka = env_or_empty("TCF_PASSWORD_" + aka);
    if (!user_aka.empty())
        c.user = user_aka;
    if (!password_aka.empty())
        c.password = password_aka;
    if (!user_cmdline.empty())
        c.user = user_cmdline;
    if (!password_cmdline.empty())
        c.password = password_cmdline;

    if (c.user.empty())
        throw BrokerError(ErrorKind::auth_failure,
                          aka + ": cannot obtain login name; use --user or environment TCF_USER[_AKA]");
    if (c.password.empty())
        throw BrokerError(ErrorKind::auth_failure,
                          aka + ": cannot obtain password; use --password or environment TCF_PASSWORD[_AKA]");
    return c;
}
