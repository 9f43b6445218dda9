/*
 * File: include/common/target.hpp
 * Project: TTB Broker Proxy
 * Purpose: Target descriptors and the broker error taxonomy
 * Notes:
 *  - See DESIGN.md
 *  - Descriptors are read-only once built; the cache hands out copies
 *  - fullid = aka/id is unique across all registered brokers
 * Last updated: 2026-10-18
 */

#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/keywords.hpp"

enum class ErrorKind
{
    unreachable,  // network/TLS failure or timeout reaching a broker
    remote_error, // broker answered with a non-2xx status
    invalid_spec, // malformed selection expression
    not_found,    // target id/spec resolves to nothing
    auth_failure  // login rejected or no credentials
};

inline const char *to_string(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::unreachable:
        return "unreachable";
    case ErrorKind::remote_error:
        return "remote error";
    case ErrorKind::invalid_spec:
        return "invalid spec";
    case ErrorKind::not_found:
        return "not found";
    case ErrorKind::auth_failure:
        return "authentication failure";
    }
    return "unknown";
}

class BrokerError : public std::runtime_error
{
    ErrorKind kind_;
    unsigned status_;

public:
    BrokerError(ErrorKind kind, const std::string &message, unsigned status = 0)
        : std::runtime_error(message), kind_(kind), status_(status) {}

    ErrorKind kind() const noexcept { return kind_; }
    // HTTP status for remote_error, 0 otherwise
    unsigned status() const noexcept { return status_; }
};

struct TargetDescriptor
{
    std::string id;
    std::string fullid;
    std::string aka; // alias of the owning broker
    nlohmann::json attributes = nlohmann::json::object();
    KeywordMap keywords; // derived, rebuilt on every fetch

    // the field is free text; anything non-null means disabled
    bool disabled() const
    {
        auto it = attributes.find("disabled");
        return it != attributes.end() && !it->is_null();
    }

    std::string owner() const
    {
        auto it = attributes.find("owner");
        return (it != attributes.end() && it->is_string()) ? it->get<std::string>() : std::string();
    }

    // having the attribute means the target is powered
    bool powered() const { return attributes.contains("powered"); }
};

inline TargetDescriptor target_from_json(const nlohmann::json &rt, const std::string &aka)
{
    if (!rt.is_object())
        throw BrokerError(ErrorKind::remote_error, aka + ": target descriptor is not an object");
    auto jid = rt.find("id");
    if (jid == rt.end() || !jid->is_string() || jid->get<std::string>().empty())
        throw BrokerError(ErrorKind::remote_error, aka + ": target descriptor without id");

    TargetDescriptor t;
    t.id = jid->get<std::string>();
    t.aka = aka;
    t.fullid = aka + "/" + t.id;
    t.attributes = rt;
    t.attributes["fullid"] = t.fullid;
    t.keywords = flatten_keywords(t.attributes, t.fullid);
    return t;
}
