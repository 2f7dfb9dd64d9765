/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#include "vr/monitor.hpp"
#include "vr/log.hpp"
#include "vr/internal/time.hpp"

#include <utility>

namespace vr {

Monitor::Monitor(internal::ActivityChannel& ch, std::size_t history)
    : _ch(ch)
    , _max_history(history == 0 ? 1 : history)
{
}

Monitor::~Monitor() {
    stop();
}

void Monitor::set_listener(Listener fn) {
    _listener = std::move(fn);
}

void Monitor::start() {
    if (_running.exchange(true)) return;
    _thread = std::thread(&Monitor::consume_loop, this);
}

void Monitor::stop() {
    _ch.close();
    if (_thread.joinable()) {
        _thread.join();
    }
    _running.store(false);
}

void Monitor::consume_loop() {
    vr::ActivityRecord rec;
    while (_ch.pop(rec)) {
        vr::log_line("[ACT] " + local_hms(rec.timestamp) + " [" + rec.client + "] " + rec.message);
        if (_listener) {
            _listener(rec);
        }
        {
            std::lock_guard<std::mutex> lk(_mtx);
            _history.push_back(std::move(rec));
            while (_history.size() > _max_history) {
                _history.pop_front();
            }
            ++_consumed;
        }
        _cv.notify_all();
    }
}

std::vector<vr::ActivityRecord> Monitor::history() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return std::vector<vr::ActivityRecord>(_history.begin(), _history.end());
}

std::uint64_t Monitor::consumed() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _consumed;
}

bool Monitor::wait_for_count(std::uint64_t n, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(_mtx);
    return _cv.wait_for(lk, timeout, [&] { return _consumed >= n; });
}

} // namespace vr
