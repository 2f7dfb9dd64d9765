/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#include "vr/internal/access_policy.hpp"

namespace vr::internal {

AccessPolicy::AccessPolicy(const vr::AccessConfig& cfg)
    : _mode(cfg.mode)
    , _limit(cfg.limit)
    , _whitelist(cfg.whitelist)
{
    if (_mode == vr::AccessMode::ServeOnce) _limit = 1;
}

std::size_t AccessPolicy::slot_limit() const {
    return _mode == vr::AccessMode::FirstNUnique ? static_cast<std::size_t>(_limit) : 0;
}

bool AccessPolicy::exhausted(const SessionCounters& st) const {
    return _limit > 0 && st.completed >= _limit;
}

Decision AccessPolicy::exhausted_decision() const {
    if (_limit == 1) {
        return Decision::deny("File has already been downloaded");
    }
    return Decision::deny("Download limit of " + std::to_string(_limit) + " already reached");
}

bool AccessPolicy::admit(const std::string& id, SessionCounters& st, bool& added) const {
    added = false;
    if (st.admitted.count(id) != 0) return true;
    if (st.admitted.size() >= slot_limit()) return false;
    st.admitted.insert(id);
    added = true;
    return true;
}

Decision AccessPolicy::evaluate(const std::string& id, SessionCounters& st) const {
    switch (_mode) {
        case vr::AccessMode::Whitelist: {
            if (_whitelist.count(id) == 0) {
                return Decision::deny("IP not in allowed list");
            }
            if (exhausted(st)) return exhausted_decision();
            return Decision::allow();
        }

        case vr::AccessMode::FirstNUnique: {
            // Checked first so a closed session never hands out new slots.
            if (exhausted(st)) return exhausted_decision();
            bool added = false;
            if (!admit(id, st, added)) {
                return Decision::deny("Limit of " + std::to_string(_limit) + " unique IPs reached");
            }
            Decision d = Decision::allow();
            d.newly_admitted = added;
            return d;
        }

        case vr::AccessMode::ServeOnce: {
            if (exhausted(st)) return exhausted_decision();
            if (st.claimed) {
                return Decision::deny("Download already in progress");
            }
            st.claimed = true;
            Decision d = Decision::allow();
            d.claimed = true;
            return d;
        }
    }
    return Decision::deny("Access denied");
}

} // namespace vr::internal
