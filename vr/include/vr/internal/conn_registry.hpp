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
#include <cstddef>
#include <mutex>
#include <unordered_map>

namespace vr::internal {

// Tracks open client sockets so shutdown can close idle keep-alive
// connections at once and wait for active transfers.
class ConnectionRegistry {
public:
    ConnectionRegistry() = default;

    // Returns false once closing has begun; the caller must drop the fd.
    bool add(int fd);

    // Mark fd as waiting for its next request. Returns false once closing
    // has begun, in which case the connection must not wait for more.
    bool set_idle(int fd);
    void set_busy(int fd);

    // Must be called before the fd is closed.
    void remove(int fd);

    // Enter closing state and shut down every idle socket.
    std::size_t close_idle();

    // Shut down every remaining socket. Returns how many were still open.
    std::size_t force_close_all();

    bool wait_empty_for(std::chrono::milliseconds d);
    void wait_empty();

    std::size_t size() const;
    bool closing() const;

private:
    mutable std::mutex _mtx;
    std::condition_variable _cv;
    std::unordered_map<int, bool> _idle;  // fd -> idle
    bool _closing = false;
};

} // namespace vr::internal
