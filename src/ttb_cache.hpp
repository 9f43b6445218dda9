/*
 * File: src/ttb_cache.hpp
 * Project: TTB Broker Proxy
 * Purpose: Merged target table across all brokers
 * Notes:
 *  - See DESIGN.md
 *  - Snapshots are immutable; publish swaps a shared_ptr under mtx_
 *  - A refresh publishes only if no invalidate() happened since it started
 *  - Projected refreshes carry partial descriptors and are never published
 * Last updated: 2026-10-18
 */

#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "common/log.hpp"
#include "common/target.hpp"
#include "ttb_session.hpp"

// fullid -> descriptor
using TargetTable = std::map<std::string, TargetDescriptor>;
using CacheSnapshot = std::shared_ptr<const TargetTable>;
using SessionList = std::vector<std::shared_ptr<BrokerSession>>;
// alias -> why its broker contributed nothing
using BrokerFailures = std::map<std::string, std::string>;

class TargetCache
{
    mutable std::mutex mtx_; // guards snapshot_, failures_ and generation_
    std::mutex fill_mtx_;    // one fan-out at a time
    CacheSnapshot snapshot_;
    BrokerFailures failures_; // of the round that built snapshot_
    std::uint64_t generation_ = 0;

    struct Fetch
    {
        std::vector<TargetDescriptor> targets;
        bool failed = false;
        std::string error;
    };

public:
    // Returns the current snapshot, or queries every session in
    // parallel (one list call each) and publishes the merged result. A
    // failing broker contributes no targets; it never fails the refresh.
    // With a projection the result goes to the caller only.
    CacheSnapshot refresh(const SessionList &sessions, const Projection &projection = {})
    {
        std::scoped_lock fill(fill_mtx_);
        std::uint64_t generation;
        {
            std::scoped_lock lk(mtx_);
            if (snapshot_)
                return snapshot_;
            generation = generation_;
        }

        auto table = std::make_shared<TargetTable>();
        BrokerFailures failures;
        auto results = fan_out(sessions, projection);
        for (std::size_t i = 0; i < results.size(); ++i)
        {
            if (results[i].failed)
                failures[sessions[i]->aka()] = results[i].error;
            for (auto &t : results[i].targets)
            {
                auto fullid = t.fullid;
                table->insert_or_assign(std::move(fullid), std::move(t));
            }
        }
        CacheSnapshot result = table;

        std::scoped_lock lk(mtx_);
        if (!projection.empty())
            ttb_log().debug("projected refresh; not publishing");
        else if (generation == generation_)
        {
            snapshot_ = result;
            failures_ = std::move(failures);
        }
        else
            ttb_log().debug("target cache invalidated during refresh; not publishing");
        return result;
    }

    void invalidate()
    {
        std::scoped_lock lk(mtx_);
        ++generation_;
        snapshot_.reset();
        failures_.clear();
    }

    // Brokers that failed in the round behind the current snapshot
    BrokerFailures failures() const
    {
        std::scoped_lock lk(mtx_);
        return failures_;
    }

    bool valid() const
    {
        std::scoped_lock lk(mtx_);
        return static_cast<bool>(snapshot_);
    }

    std::uint64_t generation() const
    {
        std::scoped_lock lk(mtx_);
        return generation_;
    }

    // null when invalid
    CacheSnapshot snapshot() const
    {
        std::scoped_lock lk(mtx_);
        return snapshot_;
    }

    // Re-fetches one target and swaps it into the current snapshot
    TargetDescriptor update_target(BrokerSession &session, const std::string &id)
    {
        auto fresh = session.describe_target(id);
        std::scoped_lock lk(mtx_);
        if (snapshot_)
        {
            auto next = std::make_shared<TargetTable>(*snapshot_);
            (*next)[fresh.fullid] = fresh;
            snapshot_ = std::move(next);
        }
        return fresh;
    }

    // Exact fullid first, then the broker-local id; on duplicates the
    // alphabetically first alias wins.
    static const TargetDescriptor *lookup(const TargetTable &table, const std::string &id)
    {
        auto it = table.find(id);
        if (it != table.end())
            return &it->second;
        const TargetDescriptor *best = nullptr;
        for (const auto &entry : table)
        {
            const auto &t = entry.second;
            if (t.id == id && (!best || t.aka < best->aka))
                best = &t;
        }
        return best;
    }

private:
    static Fetch fetch(BrokerSession &session, const Projection &projection)
    {
        Fetch f;
        try
        {
            f.targets = session.list_targets(true, projection);
        }
        catch (const std::exception &e)
        {
            ttb_log().error("{}: can't use: {}", session.url(), e.what());
            f.failed = true;
            f.error = e.what();
        }
        return f;
    }

    static std::vector<Fetch> fan_out(const SessionList &sessions, const Projection &projection)
    {
        std::vector<Fetch> results(sessions.size());
        if (sessions.empty())
            return results;
        // one worker per broker, each broker queried once
        boost::asio::thread_pool pool(sessions.size());
        for (std::size_t i = 0; i < sessions.size(); ++i)
            boost::asio::post(pool, [&results, &sessions, &projection, i]
                              { results[i] = fetch(*sessions[i], projection); });
        pool.join();
        return results;
    }
};
