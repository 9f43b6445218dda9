/*
 * File: include/common/keywords.hpp
 * Project: TTB Broker Proxy
 * Purpose: Flat keyword namespace built from target descriptors
 * Notes:
 *  - See DESIGN.md
 *  - Keys are dotted paths into the descriptor ("bsps.x86.board")
 *  - Only string/integer/boolean leaves are kept; null becomes ""
 * Last updated: 2026-10-18
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <fnmatch.h>
#include <nlohmann/json.hpp>

using KeywordValue = std::variant<std::string, std::int64_t, bool>;
using KeywordMap = std::map<std::string, KeywordValue>;

// nested maps deeper than this are not descended into
constexpr int kFlattenDepthLimit = 10;

// Drops the characters in `extra` and any whitespace; turns a URL or a
// fullid into something usable as a file name (destructive, one way)
inline std::string file_name_make_safe(const std::string &name, const std::string &extra = ":/")
{
    std::string r;
    r.reserve(name.size());
    for (char c : name)
    {
        if (extra.find(c) != std::string::npos || std::isspace(static_cast<unsigned char>(c)))
            continue;
        r += c;
    }
    return r;
}

inline bool keyword_from_json(const nlohmann::json &v, KeywordValue &out)
{
    if (v.is_null())
        out = std::string();
    else if (v.is_string())
        out = v.get<std::string>();
    else if (v.is_boolean())
        out = v.get<bool>();
    else if (v.is_number_integer())
        out = v.get<std::int64_t>();
    else
        return false; // floats, arrays and maps are not scalars
    return true;
}

inline std::string keyword_to_string(const KeywordValue &v)
{
    if (auto s = std::get_if<std::string>(&v))
        return *s;
    if (auto i = std::get_if<std::int64_t>(&v))
        return std::to_string(*i);
    return std::get<bool>(v) ? "true" : "false";
}

inline bool keyword_truthy(const KeywordValue &v)
{
    if (auto s = std::get_if<std::string>(&v))
        return !s->empty();
    if (auto i = std::get_if<std::int64_t>(&v))
        return *i != 0;
    return std::get<bool>(v);
}

inline void flatten_into(KeywordMap &kws, const nlohmann::json &node, const std::string &path, int depth)
{
    KeywordValue v;
    if (keyword_from_json(node, v))
    {
        kws[path] = std::move(v);
        return;
    }
    if (!node.is_object() || depth <= 0)
        return;
    for (auto it = node.begin(); it != node.end(); ++it)
        flatten_into(kws, it.value(), path + "." + it.key(), depth - 1);
}

// Base keyword map for a target: every scalar leaf under its dotted path,
// plus the synthetic `target` and `type` keys and the target's id and
// fullid as boolean symbols (so a bare "t1" selects target t1).
inline KeywordMap flatten_keywords(const nlohmann::json &attrs, const std::string &fullid)
{
    KeywordMap kws;
    if (attrs.is_object())
        for (auto it = attrs.begin(); it != attrs.end(); ++it)
            flatten_into(kws, it.value(), it.key(), kFlattenDepthLimit);

    std::string id;
    auto jid = attrs.find("id");
    if (jid != attrs.end() && jid->is_string())
        id = jid->get<std::string>();
    if (!fullid.empty())
        kws.emplace(fullid, true);
    if (!id.empty())
        kws.emplace(id, true);

    kws["target"] = file_name_make_safe(fullid.empty() ? id : fullid);
    auto jtype = attrs.find("type");
    if (jtype != attrs.end() && jtype->is_string())
        kws["type"] = jtype->get<std::string>();
    else
        kws["type"] = std::string("n/a");
    return kws;
}

// Keyword variant used while evaluating one sub-device (BSP): the base
// map plus `bsp` and the sub-device's own scalar attributes, unprefixed.
inline KeywordMap bsp_keywords(const KeywordMap &base, const nlohmann::json &bsp_attrs, const std::string &bsp)
{
    KeywordMap kws = base;
    kws["bsp"] = bsp;
    if (!bsp_attrs.is_object())
        return kws;
    for (auto it = bsp_attrs.begin(); it != bsp_attrs.end(); ++it)
    {
        KeywordValue v;
        if (keyword_from_json(it.value(), v))
            kws[it.key()] = std::move(v);
    }
    return kws;
}

inline std::vector<std::string> bsp_names(const nlohmann::json &attrs)
{
    std::vector<std::string> names;
    auto it = attrs.find("bsps");
    if (it == attrs.end() || !it->is_object())
        return names;
    for (auto b = it->begin(); b != it->end(); ++b)
        names.push_back(b.key());
    return names;
}

// True if `field` matches any fnmatch pattern, or if there are none
inline bool field_needed(const std::string &field, const std::vector<std::string> &projections)
{
    if (projections.empty())
        return true;
    for (const auto &p : projections)
        if (::fnmatch(p.c_str(), field.c_str(), 0) == 0)
            return true;
    return false;
}

inline void dict_to_flat_into(std::vector<std::pair<std::string, nlohmann::json>> &out,
                              const nlohmann::json &val, const std::string &flat,
                              const std::vector<std::string> &projections, int depth)
{
    if (field_needed(flat, projections))
    {
        if (val.is_object() && depth > 0)
        {
            // wanted as a whole: bring in everything below it
            for (auto it = val.begin(); it != val.end(); ++it)
                dict_to_flat_into(out, it.value(), flat + "." + it.key(), {}, depth - 1);
        }
        else
            out.emplace_back(flat, val);
    }
    else if (val.is_object() && depth > 0)
    {
        for (auto it = val.begin(); it != val.end(); ++it)
            dict_to_flat_into(out, it.value(), flat + "." + it.key(), projections, depth - 1);
    }
}

// Nested map -> (KEY[.SUBKEY...], leaf) pairs sorted by key, keeping only
// fields matching `projections` (fnmatch patterns; empty keeps all)
inline std::vector<std::pair<std::string, nlohmann::json>>
dict_to_flat(const nlohmann::json &d, const std::vector<std::string> &projections = {})
{
    std::vector<std::pair<std::string, nlohmann::json>> out;
    if (d.is_object())
        for (auto it = d.begin(); it != d.end(); ++it)
            dict_to_flat_into(out, it.value(), it.key(), projections, kFlattenDepthLimit);
    std::sort(out.begin(), out.end(),
              [](const auto &a, const auto &b) { return a.first < b.first; });
    return out;
}
