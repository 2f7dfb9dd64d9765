/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#include "vr/internal/shutdown_latch.hpp"

namespace vr::internal {

bool ShutdownLatch::trigger(vr::ShutdownReason why) {
    {
        std::lock_guard<std::mutex> lk(_mtx);
        if (_reason != vr::ShutdownReason::None) return false;
        _reason = why;
    }
    _cv.notify_all();
    return true;
}

bool ShutdownLatch::triggered() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _reason != vr::ShutdownReason::None;
}

vr::ShutdownReason ShutdownLatch::reason() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _reason;
}

void ShutdownLatch::wait() {
    std::unique_lock<std::mutex> lk(_mtx);
    _cv.wait(lk, [this] { return _reason != vr::ShutdownReason::None; });
}

bool ShutdownLatch::wait_for(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lk(_mtx);
    return _cv.wait_for(lk, d, [this] { return _reason != vr::ShutdownReason::None; });
}

} // namespace vr::internal
