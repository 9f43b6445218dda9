/*
 * File: src/ttb_select.hpp
 * Project: TTB Broker Proxy
 * Purpose: Pick targets out of the merged cache with a selection expression
 * Notes:
 *  - See DESIGN.md
 *  - Targets with BSPs match if any BSP variant matches
 *  - Malformed expressions throw BrokerError(invalid_spec); never retried
 * Last updated: 2026-10-18
 */

#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "common/keywords.hpp"
#include "common/log.hpp"
#include "common/target.hpp"
#include "ttb_cache.hpp"
#include "ttb_expr.hpp"

// Command line arguments are ORed; disabled targets are excluded
// unless asked for. No arguments and include_disabled selects all.
inline std::string compose_spec(const std::vector<std::string> &specs, bool include_disabled)
{
    std::string ored;
    for (const auto &s : specs)
    {
        if (s.empty())
            continue;
        if (!ored.empty())
            ored += " or ";
        ored += "(" + s + ")";
    }
    if (include_disabled)
        return ored;
    if (ored.empty())
        return "( not disabled )";
    return "( not disabled ) and ( " + ored + " )";
}

class TargetSelector
{
    std::string text_;
    Expression expr_;

public:
    // An empty spec matches everything
    explicit TargetSelector(const std::string &spec, const std::string &origin = "cmdline")
        : text_(spec), expr_(spec.empty() ? Expression::constant(true) : Expression::parse(spec, origin))
    {
    }

    const std::string &text() const { return text_; }

    bool matches(const TargetDescriptor &t) const
    {
        auto bsps = bsp_names(t.attributes);
        KeywordMap kws = t.keywords;
        kws["bsp_count"] = static_cast<std::int64_t>(bsps.size());

        if (bsps.empty())
        {
            bool r = expr_.evaluate(kws);
            ttb_log().debug("{}: {}selected by spec", t.fullid, r ? "" : "not ");
            return r;
        }
        const auto &all = t.attributes["bsps"];
        for (const auto &bsp : bsps)
        {
            if (expr_.evaluate(bsp_keywords(kws, all[bsp], bsp)))
            {
                ttb_log().debug("{}: selected by spec on BSP {}", t.fullid, bsp);
                return true;
            }
        }
        ttb_log().debug("{}: not selected by spec on any of {} BSPs", t.fullid, bsps.size());
        return false;
    }

    // ordered by fullid
    std::vector<TargetDescriptor> select(const TargetTable &table) const
    {
        std::vector<TargetDescriptor> out;
        for (const auto &entry : table)
            if (matches(entry.second))
                out.push_back(entry.second);
        return out;
    }
};
