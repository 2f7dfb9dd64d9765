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
#include <mutex>
#include <string>
#include <vector>
#include "vr/internal/access_policy.hpp"

namespace vr::internal {

struct Completion {
    std::uint64_t count = 0;       // completed transfers after this call
    bool counted = false;          // false once the quota was already closed
    bool reached_limit = false;    // this call closed the quota
};

// Point-in-time copy for display.
struct SessionCounts {
    std::vector<std::string> admitted;   // sorted
    std::uint64_t completed = 0;
    std::uint64_t limit = 0;             // 0 = unbounded
    std::size_t   slot_limit = 0;        // FirstNUnique only
};

// Single owner of the counters shared by all connection handlers.
// Every entry point takes the one mutex for a short, I/O-free span.
class SessionState {
public:
    explicit SessionState(const vr::AccessConfig& cfg);

    SessionState(const SessionState&) = delete;
    SessionState& operator=(const SessionState&) = delete;

    // Identity eligibility and the terminal check, in one critical section.
    Decision authorize(const std::string& id);

    // Reserve a FirstNUnique slot (or confirm an existing one).
    bool try_admit(const std::string& id);

    // Account one fully delivered transfer. reached_limit is true for
    // exactly one call over the lifetime of the session.
    Completion record_completion();

    // A granted request ended without delivering the file (open error,
    // broken transfer, HEAD). Releases the ServeOnce claim; admitted
    // FirstNUnique identifiers keep their slot. Nothing is counted.
    void release(const Decision& granted);

    bool exhausted() const;
    SessionCounts counts() const;


private:
    AccessPolicy _policy;
    mutable std::mutex _mtx;
    SessionCounters _st;
};

} // namespace vr::internal
