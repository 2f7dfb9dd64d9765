/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "vr/types.hpp"
#include "vr/internal/activity_channel.hpp"

namespace vr {

// Everything a presentation layer needs to draw the current state.
struct StatusSnapshot {
    bool server_ready = false;
    std::vector<std::string> urls;
    std::string access_mode;
    vr::FileInfo file;

    std::vector<std::string> admitted;
    std::uint64_t completed  = 0;
    std::uint64_t limit      = 0;   // 0 = unbounded
    std::size_t   slot_limit = 0;

    bool quitting = false;
    vr::ShutdownReason shutdown_reason = vr::ShutdownReason::None;
    std::string last_error;

    std::vector<vr::ActivityRecord> activity;  // oldest first
    std::uint64_t dropped = 0;
};

// Single consumer of the activity channel. Keeps a bounded recent history
// and writes every record to the log.
class Monitor {
public:
    using Listener = std::function<void(const vr::ActivityRecord&)>;

    Monitor(internal::ActivityChannel& ch, std::size_t history);
    ~Monitor();

    Monitor(const Monitor&) = delete;
    Monitor& operator=(const Monitor&) = delete;

    // Called on the consumer thread for each record. Set before start().
    void set_listener(Listener fn);

    void start();

    // Close the channel, deliver what is queued, join the consumer.
    void stop();

    std::vector<vr::ActivityRecord> history() const;
    std::uint64_t consumed() const;

    // Wait until at least n records have been consumed.
    bool wait_for_count(std::uint64_t n, std::chrono::milliseconds timeout) const;

private:
    internal::ActivityChannel& _ch;
    const std::size_t _max_history;
    Listener _listener;

    mutable std::mutex _mtx;
    mutable std::condition_variable _cv;
    std::deque<vr::ActivityRecord> _history;
    std::uint64_t _consumed = 0;

    std::thread _thread;
    std::atomic<bool> _running{false};

    void consume_loop();
};

} // namespace vr
