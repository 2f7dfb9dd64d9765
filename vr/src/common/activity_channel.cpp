/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#include "vr/internal/activity_channel.hpp"
#include <utility>

namespace vr::internal {

ActivityChannel::ActivityChannel(std::size_t capacity)
    : _capacity(capacity == 0 ? 1 : capacity)
{
}

bool ActivityChannel::push(vr::ActivityRecord rec) {
    bool kept_all = true;
    {
        std::lock_guard<std::mutex> lk(_mtx);
        if (_closed) return false;
        // drop oldest
        while (_q.size() >= _capacity) {
            _q.pop_front();
            ++_dropped;
            kept_all = false;
        }
        _q.push_back(std::move(rec));
    }
    _cv.notify_one();
    return kept_all;
}

bool ActivityChannel::pop(vr::ActivityRecord& out) {
    std::unique_lock<std::mutex> lk(_mtx);
    _cv.wait(lk, [this] { return !_q.empty() || _closed; });
    if (_q.empty()) return false;
    out = std::move(_q.front());
    _q.pop_front();
    return true;
}

void ActivityChannel::close() {
    {
        std::lock_guard<std::mutex> lk(_mtx);
        _closed = true;
    }
    _cv.notify_all();
}

std::size_t ActivityChannel::size() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _q.size();
}

std::uint64_t ActivityChannel::dropped() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _dropped;
}

} // namespace vr::internal
