/*
 * File: src/ttb_ops.hpp
 * Project: TTB Broker Proxy
 * Purpose: Operations the CLI drives: list, acquire/release/active, login/logout
 * Notes:
 *  - See DESIGN.md
 *  - Everything goes through an explicit BrokerContext
 *  - Ownership changes invalidate the cache; a rejected acquire is reported, not thrown
 * Last updated: 2026-10-18
 */

#pragma once
#include <algorithm>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/keywords.hpp"
#include "common/log.hpp"
#include "common/target.hpp"
#include "ttb_config.hpp"
#include "ttb_context.hpp"
#include "ttb_select.hpp"

using AcquireReport = std::vector<std::pair<TargetDescriptor, AcquireOutcome>>;

inline std::vector<TargetDescriptor> select_targets(BrokerContext &ctx, const std::vector<std::string> &specs,
                                                    bool include_disabled, const Projection &projection = {})
{
    TargetSelector selector(compose_spec(specs, include_disabled));
    auto snapshot = ctx.targets(projection);
    return selector.select(*snapshot);
}

inline std::vector<TargetDescriptor> find_all(BrokerContext &ctx, bool include_disabled = false)
{
    std::vector<TargetDescriptor> out;
    auto snapshot = ctx.targets();
    for (const auto &entry : *snapshot)
        if (include_disabled || !entry.second.disabled())
            out.push_back(entry.second);
    return out;
}

// Explicit ids (bare or fullid) first; otherwise whatever `spec` selects,
// disabled targets included. Nothing found is BrokerError(not_found).
inline std::vector<TargetDescriptor> resolve_targets(BrokerContext &ctx, const std::vector<std::string> &ids,
                                                     const std::string &spec = "")
{
    std::vector<TargetDescriptor> out;
    for (const auto &id : ids)
        out.push_back(ctx.target(id));
    if (!spec.empty())
    {
        auto selected = select_targets(ctx, {spec}, true);
        if (selected.empty())
            throw BrokerError(ErrorKind::not_found, "no targets match '" + spec + "'");
        out.insert(out.end(), selected.begin(), selected.end());
    }
    return out;
}

inline AcquireReport acquire_targets(BrokerContext &ctx, const std::vector<TargetDescriptor> &targets,
                                     const std::string &ticket = "", bool force = false)
{
    AcquireReport report;
    try
    {
        for (const auto &t : targets)
            report.emplace_back(t, ctx.owner(t)->acquire(t, ticket, force));
    }
    catch (const std::exception &)
    {
        ctx.invalidate();
        throw;
    }
    ctx.invalidate();
    return report;
}

inline void release_targets(BrokerContext &ctx, const std::vector<TargetDescriptor> &targets,
                            const std::string &ticket = "", bool force = false)
{
    try
    {
        for (const auto &t : targets)
            ctx.owner(t)->release(t, ticket, force);
    }
    catch (const std::exception &)
    {
        ctx.invalidate();
        throw;
    }
    ctx.invalidate();
}

inline void activate_targets(BrokerContext &ctx, const std::vector<TargetDescriptor> &targets,
                             const std::string &ticket = "")
{
    for (const auto &t : targets)
        ctx.owner(t)->set_active(t, ticket);
}

// Logs into every broker not already known valid. Throws
// BrokerError(auth_failure) unless at least one broker ends up logged in.
inline std::size_t login_all(BrokerContext &ctx, const std::string &user = "", const std::string &password = "")
{
    std::size_t ok = 0;
    auto sessions = ctx.brokers();
    for (const auto &session : sessions)
    {
        if (session->validity() == SessionValidity::valid)
        {
            ++ok;
            continue;
        }
        try
        {
            auto creds = resolve_credentials(session->aka(), user, password);
            if (session->login(creds.user, creds.password))
            {
                ttb_log().info("{}: logged in as {}", session->url(), creds.user);
                ++ok;
            }
        }
        catch (const std::exception &e)
        {
            ttb_log().error("{}: cannot login: {}", session->url(), e.what());
        }
    }
    if (ok == 0)
        throw BrokerError(ErrorKind::auth_failure,
                          sessions.empty() ? "no brokers configured" : "could not login to any broker");
    ctx.invalidate();
    return ok;
}

inline void logout_all(BrokerContext &ctx)
{
    for (const auto &session : ctx.brokers())
    {
        if (session->validity() == SessionValidity::valid)
        {
            try
            {
                session->logout();
            }
            catch (const std::exception &e)
            {
                ttb_log().error("{}: cannot logout: {}", session->url(), e.what());
            }
        }
        session->trash_state();
    }
    ctx.invalidate();
}

inline std::string flat_value(const nlohmann::json &v)
{
    if (v.is_string())
        return v.get<std::string>();
    if (v.is_null())
        return "";
    return v.dump();
}

// 0: fullid; 1: fullid [owner] ON; 2: fullid and a flat dump; 3+: JSON
inline std::string format_target(const TargetDescriptor &t, int verbosity, const Projection &projection = {})
{
    std::ostringstream os;
    if (verbosity <= 0)
        os << t.fullid << "\n";
    else if (verbosity == 1)
    {
        os << t.fullid << " ";
        auto owner = t.owner();
        if (!owner.empty())
            os << "[" << owner << "]";
        if (t.powered())
            os << " ON";
        os << "\n";
    }
    else if (verbosity == 2)
    {
        os << t.fullid << "\n";
        for (const auto &kv : dict_to_flat(t.attributes, projection))
            os << "  " << kv.first << ": " << flat_value(kv.second) << "\n";
    }
    else
        os << t.attributes.dump(4) << "\n";
    return os.str();
}

inline nlohmann::json targets_to_json(const std::vector<TargetDescriptor> &targets)
{
    nlohmann::json out = nlohmann::json::array();
    for (const auto &t : targets)
        out.push_back(t.attributes);
    return out;
}

inline std::string format_targets(const std::vector<TargetDescriptor> &targets, int verbosity,
                                  const Projection &projection = {})
{
    if (verbosity >= 3)
        return targets_to_json(targets).dump(4) + "\n";
    std::string out;
    for (const auto &t : targets)
        out += format_target(t, verbosity, projection);
    return out;
}

// Column-major listing for a terminal `width` wide; `@` owned, `!` powered
inline std::string format_table(const std::vector<TargetDescriptor> &targets, std::size_t width)
{
    if (targets.empty())
        return "";
    std::vector<std::pair<std::string, std::string>> rows;
    std::size_t maxlen = 0;
    for (const auto &t : targets)
    {
        std::string suffix;
        if (!t.owner().empty())
            suffix += "@";
        if (t.powered())
            suffix += "!";
        maxlen = std::max(maxlen, t.fullid.size());
        rows.emplace_back(t.fullid, suffix);
    }
    std::sort(rows.begin(), rows.end());

    // name, space, two-char suffix, space
    std::size_t columns = std::max<std::size_t>(1, width / (maxlen + 4));
    std::size_t nrows = (rows.size() + columns - 1) / columns;
    std::ostringstream os;
    for (std::size_t r = 0; r < nrows; ++r)
    {
        for (std::size_t c = 0; c < columns; ++c)
        {
            std::size_t idx = nrows * c + r;
            if (idx >= rows.size())
                break;
            const auto &e = rows[idx];
            os << e.first << std::string(maxlen - e.first.size(), ' ') << " " << e.second
               << std::string(2 - std::min<std::size_t>(2, e.second.size()), ' ') << " ";
        }
        os << "\n";
    }
    return os.str();
}
