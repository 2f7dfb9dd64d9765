/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#pragma once
#include <cstdint>
#include <string>
#include <unordered_set>
#include <utility>
#include "vr/server_config.hpp"

namespace vr::internal {

// Mutable counters the policy reads and updates. Plain data: the owner
// (SessionState) serializes every access with its mutex.
struct SessionCounters {
    std::unordered_set<std::string> admitted;  // FirstNUnique slots
    std::uint64_t completed = 0;
    bool          claimed   = false;           // ServeOnce transfer in flight
};

struct Decision {
    bool        allowed = false;
    bool        newly_admitted = false;  // took a FirstNUnique slot
    bool        claimed = false;         // took the ServeOnce claim
    std::string reason;                  // set when denied

    static Decision allow() { Decision d; d.allowed = true; return d; }
    static Decision deny(std::string why) {
        Decision d; d.reason = std::move(why); return d;
    }
};

// Pure allow/deny logic over SessionCounters.
class AccessPolicy {
public:
    explicit AccessPolicy(const vr::AccessConfig& cfg);

    // Caller must hold the lock protecting st. May admit id into a free
    // FirstNUnique slot or take the ServeOnce claim as part of the decision.
    Decision evaluate(const std::string& id, SessionCounters& st) const;

    // FirstNUnique slot check-and-insert. True for an already admitted id
    // or when a free slot was taken (then `added` is set).
    bool admit(const std::string& id, SessionCounters& st, bool& added) const;

    // Terminal condition: the effective limit has been delivered.
    bool exhausted(const SessionCounters& st) const;

    // Denial returned once the terminal condition holds.
    Decision exhausted_decision() const;

    // 0 means unbounded (pure whitelist).
    std::uint64_t effective_limit() const { return _limit; }

    std::size_t slot_limit() const;

private:
    vr::AccessMode _mode;
    std::uint64_t  _limit;
    std::unordered_set<std::string> _whitelist;
};

} // namespace vr::internal
