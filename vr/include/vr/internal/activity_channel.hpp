/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include "vr/types.hpp"

namespace vr::internal {

// Bounded multi-producer / single-consumer queue of activity records.
// Producers never block: when the queue is full the oldest record is
// dropped to make room.
class ActivityChannel {
public:
    explicit ActivityChannel(std::size_t capacity);

    ActivityChannel(const ActivityChannel&) = delete;
    ActivityChannel& operator=(const ActivityChannel&) = delete;

    // Returns false if the record was discarded (channel closed) or an
    // older record had to be dropped.
    bool push(vr::ActivityRecord rec);

    // Blocks until a record is available. Returns false once the channel
    // is closed and drained.
    bool pop(vr::ActivityRecord& out);

    // Wake the consumer; queued records are still delivered.
    void close();

    std::size_t   size() const;
    std::uint64_t dropped() const;

private:
    const std::size_t _capacity;
    mutable std::mutex _mtx;
    std::condition_variable _cv;
    std::deque<vr::ActivityRecord> _q;
    std::uint64_t _dropped = 0;
    bool _closed = false;
};

} // namespace vr::internal
