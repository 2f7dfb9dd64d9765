/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#include "vr/internal/conn_registry.hpp"

#include <sys/socket.h>

namespace vr::internal {

bool ConnectionRegistry::add(int fd) {
    std::lock_guard<std::mutex> lk(_mtx);
    if (_closing) return false;
    _idle[fd] = false;
    return true;
}

bool ConnectionRegistry::set_idle(int fd) {
    std::lock_guard<std::mutex> lk(_mtx);
    if (_closing) return false;
    auto it = _idle.find(fd);
    if (it != _idle.end()) it->second = true;
    return true;
}

void ConnectionRegistry::set_busy(int fd) {
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _idle.find(fd);
    if (it != _idle.end()) it->second = false;
}

void ConnectionRegistry::remove(int fd) {
    {
        std::lock_guard<std::mutex> lk(_mtx);
        _idle.erase(fd);
    }
    _cv.notify_all();
}

std::size_t ConnectionRegistry::close_idle() {
    std::lock_guard<std::mutex> lk(_mtx);
    _closing = true;
    std::size_t n = 0;
    for (const auto& kv : _idle) {
        if (kv.second) {
            // wakes the handler blocked in recv()
            ::shutdown(kv.first, SHUT_RDWR);
            ++n;
        }
    }
    return n;
}

std::size_t ConnectionRegistry::force_close_all() {
    std::lock_guard<std::mutex> lk(_mtx);
    _closing = true;
    for (const auto& kv : _idle) {
        ::shutdown(kv.first, SHUT_RDWR);
    }
    return _idle.size();
}

bool ConnectionRegistry::wait_empty_for(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lk(_mtx);
    return _cv.wait_for(lk, d, [this] { return _idle.empty(); });
}

void ConnectionRegistry::wait_empty() {
    std::unique_lock<std::mutex> lk(_mtx);
    _cv.wait(lk, [this] { return _idle.empty(); });
}

std::size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _idle.size();
}

bool ConnectionRegistry::closing() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _closing;
}

} // namespace vr::internal
