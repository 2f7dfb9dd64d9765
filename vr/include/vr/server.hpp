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
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "vr/monitor.hpp"
#include "vr/server_config.hpp"
#include "vr/types.hpp"
#include "vr/internal/activity_channel.hpp"
#include "vr/internal/conn_registry.hpp"
#include "vr/internal/coordinator.hpp"
#include "vr/internal/session_state.hpp"
#include "vr/internal/shutdown_latch.hpp"

namespace vr {

// Single-file HTTP server that closes itself once its access policy is
// satisfied.
class Server {
public:
    // Validates cfg and inspects the file (ConfigError).
    explicit Server(const ServerConfig& cfg);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Bind, listen and start accepting (BindError). Non-blocking.
    void start();

    // Block until shutdown is requested, then run the shutdown sequence.
    // Throws ShutdownError if transfers outlive the grace period.
    void wait();

    // Blocking run: start() + wait().
    void run();

    // Manual cancellation. Safe from any thread, any number of times.
    void stop();

    // Bound port; valid after start().
    uint16_t port() const { return _port.load(std::memory_order_relaxed); }

    StatusSnapshot snapshot() const;

    Monitor& monitor() { return _monitor; }

private:
    ServerConfig _cfg;
    FileInfo _file;
    internal::SessionState _state;
    internal::ActivityChannel _activity;
    Monitor _monitor;
    internal::ShutdownLatch _latch;
    internal::ConnectionRegistry _conns;
    std::unique_ptr<internal::TransferCoordinator> _coord;

    int _listen_fd = -1;
    std::atomic<uint16_t> _port{0};
    std::atomic<bool> _stop{false};
    std::thread _accept_thread;

    std::mutex _workers_mtx;
    std::vector<std::thread> _workers;
    std::vector<std::thread::id> _done;  // exited, not yet joined

    mutable std::mutex _status_mtx;
    bool _ready = false;
    bool _finished = false;
    std::vector<std::string> _urls;
    std::string _last_error;

    void accept_loop();
    void request_shutdown(ShutdownReason why);
    void shutdown_sequence();
    void reap_workers_locked();
    void join_workers();

    // helpers
    int create_listen_socket();
};

} // namespace vr
