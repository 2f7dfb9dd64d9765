/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#include "vr/internal/session_state.hpp"
#include <algorithm>

namespace vr::internal {

SessionState::SessionState(const vr::AccessConfig& cfg)
    : _policy(cfg)
{
}

Decision SessionState::authorize(const std::string& id) {
    std::lock_guard<std::mutex> lk(_mtx);
    Decision d = _policy.evaluate(id, _st);
    // The quota may have closed between an earlier admission and now.
    if (d.allowed && _policy.exhausted(_st)) {
        return _policy.exhausted_decision();
    }
    return d;
}

bool SessionState::try_admit(const std::string& id) {
    std::lock_guard<std::mutex> lk(_mtx);
    bool added = false;
    return _policy.admit(id, _st, added);
}

Completion SessionState::record_completion() {
    std::lock_guard<std::mutex> lk(_mtx);
    Completion c;
    _st.claimed = false;
    if (_policy.exhausted(_st)) {
        // Admitted before the quota closed, finished after: delivered,
        // but the counter stays at the limit.
        c.count = _st.completed;
        return c;
    }
    ++_st.completed;
    c.count = _st.completed;
    c.counted = true;
    c.reached_limit = _policy.exhausted(_st);
    return c;
}

void SessionState::release(const Decision& granted) {
    if (!granted.claimed) return;
    std::lock_guard<std::mutex> lk(_mtx);
    _st.claimed = false;
}

bool SessionState::exhausted() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _policy.exhausted(_st);
}

SessionCounts SessionState::counts() const {
    SessionCounts c;
    {
        std::lock_guard<std::mutex> lk(_mtx);
        c.admitted.assign(_st.admitted.begin(), _st.admitted.end());
        c.completed = _st.completed;
    }
    std::sort(c.admitted.begin(), c.admitted.end());
    c.limit = _policy.effective_limit();
    c.slot_limit = _policy.slot_limit();
    return c;
}

} // namespace vr::internal
