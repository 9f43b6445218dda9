/*
 * File: src/ttb_context.hpp
 * Project: TTB Broker Proxy
 * Purpose: Registered brokers plus their merged target cache
 * Notes:
 *  - See DESIGN.md
 *  - Built once from configuration and passed to every operation
 *  - Adding or removing a broker invalidates the cache
 * Last updated: 2026-10-18
 */

#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include "common/log.hpp"
#include "common/target.hpp"
#include "ttb_cache.hpp"
#include "ttb_config.hpp"
#include "ttb_session.hpp"

class BrokerContext
{
    mutable std::mutex mtx_;
    std::map<std::string, std::shared_ptr<BrokerSession>> sessions_; // by aka
    fs::path state_dir_;
    TargetCache cache_;

public:
    explicit BrokerContext(fs::path state_dir) : state_dir_(std::move(state_dir)) {}

    explicit BrokerContext(const ProxyConfig &cfg) : state_dir_(cfg.state_dir)
    {
        for (const auto &b : cfg.brokers)
            add_broker(b);
    }

    BrokerContext(const BrokerContext &) = delete;
    BrokerContext &operator=(const BrokerContext &) = delete;

    const fs::path &state_dir() const { return state_dir_; }
    TargetCache &cache() { return cache_; }

    // Loads the broker's persisted cookies; aliases must be unique
    std::shared_ptr<BrokerSession> add_broker(const BrokerConfig &cfg, std::shared_ptr<HttpTransport> transport = nullptr)
    {
        auto session = std::make_shared<BrokerSession>(cfg, std::move(transport));
        {
            std::scoped_lock lk(mtx_);
            auto it = sessions_.find(session->aka());
            if (it != sessions_.end())
                throw std::runtime_error(session->url() + ": alias '" + session->aka() + "' already used by " +
                                         it->second->url());
            sessions_.emplace(session->aka(), session);
        }
        if (!state_dir_.empty())
            session->load_state(state_dir_);
        cache_.invalidate();
        return session;
    }

    bool remove_broker(const std::string &aka)
    {
        bool removed;
        {
            std::scoped_lock lk(mtx_);
            removed = sessions_.erase(aka) > 0;
        }
        if (removed)
            cache_.invalidate();
        return removed;
    }

    // by alias or by URL; null if unknown
    std::shared_ptr<BrokerSession> broker(const std::string &name) const
    {
        std::scoped_lock lk(mtx_);
        auto it = sessions_.find(name);
        if (it != sessions_.end())
            return it->second;
        for (const auto &entry : sessions_)
            if (entry.second->url() == name)
                return entry.second;
        return nullptr;
    }

    // sorted by alias
    SessionList brokers() const
    {
        std::scoped_lock lk(mtx_);
        SessionList out;
        out.reserve(sessions_.size());
        for (const auto &entry : sessions_)
            out.push_back(entry.second);
        return out;
    }

    CacheSnapshot targets(const Projection &projection = {}) { return cache_.refresh(brokers(), projection); }

    void invalidate() { cache_.invalidate(); }

    std::optional<TargetDescriptor> find_target(const std::string &id)
    {
        auto snapshot = targets();
        if (auto t = TargetCache::lookup(*snapshot, id))
            return *t;
        return std::nullopt;
    }

    // Throws BrokerError(unreachable) when the target may live on a broker
    // that failed to answer, BrokerError(not_found) otherwise
    TargetDescriptor target(const std::string &id)
    {
        auto t = find_target(id);
        if (t)
            return *t;
        auto failed = cache_.failures();
        auto slash = id.find('/');
        if (slash != std::string::npos)
        {
            auto it = failed.find(id.substr(0, slash));
            if (it != failed.end())
                throw BrokerError(ErrorKind::unreachable,
                                  "target-id '" + id + "': broker '" + it->first + "' unavailable: " + it->second);
        }
        else if (!failed.empty())
        {
            std::string akas;
            for (const auto &f : failed)
                akas += (akas.empty() ? "" : ", ") + f.first;
            throw BrokerError(ErrorKind::unreachable,
                              "target-id '" + id + "': not found; brokers unavailable: " + akas);
        }
        throw BrokerError(ErrorKind::not_found, "target-id '" + id + "': not found");
    }

    std::shared_ptr<BrokerSession> owner(const TargetDescriptor &t) const
    {
        auto session = broker(t.aka);
        if (!session)
            throw BrokerError(ErrorKind::not_found, t.fullid + ": broker '" + t.aka + "' is not registered");
        return session;
    }

    // Re-reads one target from its broker and refreshes its cache entry
    TargetDescriptor update_target(const std::string &id)
    {
        auto t = target(id);
        return cache_.update_target(*owner(t), t.id);
    }

    // Persists every session's cookies; a failing broker does not stop the rest
    void save_state() const
    {
        if (state_dir_.empty())
            return;
        for (const auto &session : brokers())
        {
            try
            {
                session->save_state(state_dir_);
            }
            catch (const std::exception &e)
            {
                ttb_log().error("{}: cannot save state: {}", session->url(), e.what());
            }
        }
    }
};
