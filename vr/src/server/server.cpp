/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#include "vr/server.hpp"
#include "vr/errors.hpp"
#include "vr/log.hpp"
#include "vr/internal/file_info.hpp"
#include "vr/internal/netif.hpp"
#include "vr/internal/utils.hpp"
#include "vr/internal/workers.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <string>
#include <thread>
#include <utility>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>

// Forward declaration of the per-connection handler provided by http_plain.cpp.
namespace vr::internal {

// Handles a single plain HTTP connection (keep-alive is managed inside).
// Does not close fd.
void handle_connection_plain(int fd,
                             const vr::ServerConfig& cfg,
                             const std::string& peer,
                             TransferCoordinator& coord,
                             ConnectionRegistry& conns);

} // namespace vr::internal

namespace vr {

// ---------- small socket helpers (internal) ----------

static int set_reuseaddr(int s) { int o = 1; return ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &o, sizeof(o)); }
static int set_dualstack(int s) { int o = 0; return ::setsockopt(s, IPPROTO_IPV6, IPV6_V6ONLY, &o, sizeof(o)); }
static int set_nodelay (int s)  { int o = 1; return ::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &o, sizeof(o)); }

// "ip:port" for IPv4 (including v4-mapped IPv6), "[ip]:port" for IPv6.
static std::string sockaddr_to_peer(const sockaddr_storage& ss) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        const sockaddr_in* a = reinterpret_cast<const sockaddr_in*>(&ss);
        inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf));
        return std::string(buf) + ":" + std::to_string(ntohs(a->sin_port));
    }
    if (ss.ss_family == AF_INET6) {
        const sockaddr_in6* a = reinterpret_cast<const sockaddr_in6*>(&ss);
        const std::string port = std::to_string(ntohs(a->sin6_port));
        if (IN6_IS_ADDR_V4MAPPED(&a->sin6_addr)) {
            in_addr v4{};
            std::memcpy(&v4, a->sin6_addr.s6_addr + 12, sizeof(v4));
            inet_ntop(AF_INET, &v4, buf, sizeof(buf));
            return std::string(buf) + ":" + port;
        }
        inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf));
        return "[" + std::string(buf) + "]:" + port;
    }
    return "unknown";
}

static const ServerConfig& validated(const ServerConfig& cfg) {
    validate_config(cfg);
    return cfg;
}

// ---------- Server impl ----------

Server::Server(const ServerConfig& cfg)
    : _cfg(validated(cfg))
    , _state(_cfg.access)
    , _activity(_cfg.activity_capacity)
    , _monitor(_activity, _cfg.activity_history)
{
    _file = internal::inspect_file(_cfg.file_path);
    _coord = std::make_unique<internal::TransferCoordinator>(
        _cfg, _state, _activity,
        [this]() { request_shutdown(ShutdownReason::LimitReached); });
}

Server::~Server() {
    bool finished;
    {
        std::lock_guard<std::mutex> lk(_status_mtx);
        finished = _finished;
    }
    if (!finished) {
        stop();
        try {
            wait();
        } catch (const ShutdownError& e) {
            vr::log_line(std::string("[ERROR] ") + e.what());
        }
    }
}

void Server::stop() {
    request_shutdown(ShutdownReason::Manual);
}

void Server::request_shutdown(ShutdownReason why) {
    // Quota path and manual cancel meet here; only the first one counts.
    if (!_latch.trigger(why)) return;

    ActivityRecord rec;
    rec.timestamp = std::chrono::system_clock::now();
    rec.client    = "Server";
    rec.kind      = ActivityKind::Server;
    rec.message   = (why == ShutdownReason::LimitReached)
                        ? "Download limit reached. Shutting down..."
                        : "Shutdown requested. Stopping server...";
    (void)_activity.push(std::move(rec));
    vr::log_line(std::string("[INFO] Shutdown signal received (") + to_string(why) +
                 "), stopping server...");
}

int Server::create_listen_socket() {
    int srv = ::socket(AF_INET6, SOCK_STREAM | SOCK_CLOEXEC, 0);
    bool v6 = srv >= 0;
    if (!v6) {
        srv = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    }
    if (srv < 0) {
        vr::log_line(std::string("[FATAL] socket() failed: ") + std::strerror(errno));
        throw BindError(std::string("socket() failed: ") + std::strerror(errno));
    }
    (void)set_reuseaddr(srv);

    int rc;
    if (v6) {
        (void)set_dualstack(srv);
        sockaddr_in6 addr{};
        addr.sin6_family = AF_INET6;
        addr.sin6_addr = in6addr_any;
        addr.sin6_port = htons(_cfg.port);
        rc = ::bind(srv, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    } else {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = INADDR_ANY;
        addr.sin_port = htons(_cfg.port);
        rc = ::bind(srv, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    }
    if (rc < 0) {
        const std::string why = std::strerror(errno);
        vr::log_line("[FATAL] bind() failed: " + why);
        ::close(srv);
        throw BindError("failed to listen on port " + std::to_string(_cfg.port) + ": " + why);
    }
    if (::listen(srv, 512) < 0) {
        const std::string why = std::strerror(errno);
        vr::log_line("[FATAL] listen() failed: " + why);
        ::close(srv);
        throw BindError("listen() failed: " + why);
    }

    sockaddr_storage bound{};
    socklen_t bl = sizeof(bound);
    if (::getsockname(srv, reinterpret_cast<sockaddr*>(&bound), &bl) == 0) {
        if (bound.ss_family == AF_INET6) {
            _port.store(ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port));
        } else {
            _port.store(ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port));
        }
    } else {
        _port.store(_cfg.port);
    }
    return srv;
}

void Server::start() {
    if (_listen_fd >= 0) return;

    // Basic boot log
    vr::log_line("[INFO] Vrushie server starting...");
    vr::log_line("[INFO] File: " + _file.name + " (" + internal::format_bytes(_file.size) +
                 ", sha256=" + _file.sha256 + ")");
    vr::log_line(std::string("[INFO] Access: ") + to_string(_cfg.access.mode) + " (" +
                 describe_access(_cfg.access) + ")");
    vr::log_line("[INFO] Grace period=" + std::to_string(_cfg.grace_sec) +
                 "s, send timeout=" + std::to_string(_cfg.send_timeout_sec) +
                 "s, KA timeout=" + std::to_string(_cfg.ka_timeout_sec) +
                 "s, KA max=" + std::to_string(_cfg.ka_max));

    _listen_fd = create_listen_socket();
    _monitor.start();

    std::vector<std::string> urls = internal::serving_urls(port());
    {
        std::lock_guard<std::mutex> lk(_status_mtx);
        _urls = urls;
        _ready = true;
    }
    vr::log_line("[INFO] Listening HTTP on :" + std::to_string(port()));
    for (const auto& u : urls) {
        vr::log_line("[INFO]   " + u);
    }

    _accept_thread = std::thread(&Server::accept_loop, this);
}

void Server::run() {
    start();
    wait();  // blocking
}

void Server::accept_loop() {
    while (!_stop.load(std::memory_order_relaxed)) {
        sockaddr_storage cli{};
        socklen_t cl = sizeof(cli);
        int fd = ::accept4(_listen_fd, reinterpret_cast<sockaddr*>(&cli), &cl, SOCK_CLOEXEC);
        if (fd < 0) {
            if (_stop.load(std::memory_order_relaxed)) break;
            if (errno == EINTR || errno == ECONNABORTED) continue;
            if (errno == EMFILE || errno == ENFILE || errno == ENOBUFS || errno == ENOMEM) {
                vr::log_line(std::string("[WARN] accept() failed: ") + std::strerror(errno));
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                continue;
            }
            vr::log_line(std::string("[ERROR] accept() failed: ") + std::strerror(errno));
            break;
        }
        (void)set_nodelay(fd);
        if (!_conns.add(fd)) {
            ::close(fd);
            continue;
        }
        std::string peer = sockaddr_to_peer(cli);

        std::lock_guard<std::mutex> lk(_workers_mtx);
        reap_workers_locked();
        const bool started = internal::spawn_worker(_workers, [this, fd, peer]() {
            internal::handle_connection_plain(fd, _cfg, peer, *_coord, _conns);
            _conns.remove(fd);
            ::close(fd);
            std::lock_guard<std::mutex> wl(_workers_mtx);
            _done.push_back(std::this_thread::get_id());
        });
        if (!started) {
            _conns.remove(fd);
            ::close(fd);
        }
    }
}

void Server::reap_workers_locked() {
    for (const auto& id : _done) {
        auto it = std::find_if(_workers.begin(), _workers.end(),
                               [&](const std::thread& t) { return t.get_id() == id; });
        if (it != _workers.end()) {
            it->join();
            _workers.erase(it);
        }
    }
    _done.clear();
}

void Server::join_workers() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lk(_workers_mtx);
        workers.swap(_workers);
        _done.clear();
    }
    for (auto& t : workers) {
        if (t.joinable()) t.join();
    }
}

void Server::wait() {
    {
        std::lock_guard<std::mutex> lk(_status_mtx);
        if (_finished) return;
    }
    _latch.wait();
    shutdown_sequence();
}

void Server::shutdown_sequence() {
    // (a) stop accepting; idle keep-alive connections are closed at once
    _stop.store(true, std::memory_order_relaxed);
    if (_listen_fd >= 0) {
        ::shutdown(_listen_fd, SHUT_RDWR);
    }
    if (_accept_thread.joinable()) {
        _accept_thread.join();
    }
    if (_listen_fd >= 0) {
        ::close(_listen_fd);
        _listen_fd = -1;
    }
    const std::size_t idle = _conns.close_idle();
    const std::size_t active = _conns.size() - std::min(_conns.size(), idle);
    if (active > 0) {
        vr::log_line("[INFO] Waiting up to " + std::to_string(_cfg.grace_sec) + "s for " +
                     std::to_string(active) + " active transfer(s)");
    }

    std::string err;
    if (!_conns.wait_empty_for(std::chrono::seconds(_cfg.grace_sec))) {
        const std::size_t left = _conns.force_close_all();
        err = "server shutdown failed: grace period of " + std::to_string(_cfg.grace_sec) +
              "s exceeded with " + std::to_string(left) + " connection(s) still open";
        vr::log_line("[ERROR] " + err);
        _conns.wait_empty();
    }

    // (b) every handler has let go of its socket
    join_workers();
    _monitor.stop();

    {
        std::lock_guard<std::mutex> lk(_status_mtx);
        _finished = true;
        _last_error = err;
    }
    if (!err.empty()) {
        throw ShutdownError(err);
    }
    vr::log_line("[INFO] Server stopped gracefully.");
}

StatusSnapshot Server::snapshot() const {
    StatusSnapshot s;
    {
        std::lock_guard<std::mutex> lk(_status_mtx);
        s.server_ready = _ready;
        s.urls = _urls;
        s.last_error = _last_error;
    }
    s.access_mode = describe_access(_cfg.access);
    s.file = _file;

    internal::SessionCounts c = _state.counts();
    s.admitted   = std::move(c.admitted);
    s.completed  = c.completed;
    s.limit      = c.limit;
    s.slot_limit = c.slot_limit;

    s.quitting        = _latch.triggered();
    s.shutdown_reason = _latch.reason();
    s.activity = _monitor.history();
    s.dropped  = _activity.dropped();
    return s;
}

} // namespace vr
