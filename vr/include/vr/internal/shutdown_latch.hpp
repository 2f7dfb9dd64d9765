/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include "vr/types.hpp"

namespace vr::internal {

// One-shot latch shared by the quota path and manual cancellation.
class ShutdownLatch {
public:
    ShutdownLatch() = default;

    // Returns true only for the call that fired the latch.
    bool trigger(vr::ShutdownReason why);

    bool triggered() const;
    vr::ShutdownReason reason() const;

    void wait();
    bool wait_for(std::chrono::milliseconds d);

private:
    mutable std::mutex _mtx;
    std::condition_variable _cv;
    vr::ShutdownReason _reason = vr::ShutdownReason::None;
};

} // namespace vr::internal
