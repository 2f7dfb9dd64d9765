/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#include "vr/internal/coordinator.hpp"
#include "vr/internal/utils.hpp"
#include "vr/log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>
#include <vector>

#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <arpa/inet.h>

namespace vr::internal {

std::string client_id_from_peer(const std::string& peer) {
    // "[v6]:port"
    if (!peer.empty() && peer.front() == '[') {
        std::size_t close = peer.find(']');
        if (close == std::string::npos || close == 1) return peer;
        if (close + 1 < peer.size() && peer[close + 1] != ':') return peer;
        return peer.substr(1, close - 1);
    }
    std::size_t colon = peer.rfind(':');
    if (colon == std::string::npos) return peer;
    // Bare IPv6 without brackets: no port to strip.
    if (peer.find(':') != colon) return peer;
    std::string host = peer.substr(0, colon);
    std::string port = peer.substr(colon + 1);
    if (host.empty() || port.empty()) return peer;
    for (char c : port) {
        if (c < '0' || c > '9') return peer;
    }
    return host;
}

TransferCoordinator::TransferCoordinator(const vr::ServerConfig& cfg,
                                         SessionState& state,
                                         ActivityChannel& activity,
                                         std::function<void()> on_limit_reached)
    : _file_path(cfg.file_path)
    , _file_name(base_name(cfg.file_path))
    , _state(state)
    , _activity(activity)
    , _on_limit_reached(std::move(on_limit_reached))
{
}

void TransferCoordinator::emit(const std::string& client, vr::ActivityKind kind, std::string msg) {
    vr::ActivityRecord rec;
    rec.timestamp = std::chrono::system_clock::now();
    rec.client    = client;
    rec.kind      = kind;
    rec.message   = std::move(msg);
    // Never waits for the observer; a full channel drops its oldest record.
    (void)_activity.push(std::move(rec));
}

RequestOutcome TransferCoordinator::reject(const std::string& client,
                                           const std::string& reason,
                                           ResponseSink& sink)
{
    emit(client, vr::ActivityKind::Rejected, "Rejected: " + reason);
    vr::log_line("[403] ip=" + client + " reason=" + reason);
    const std::string body = reason + "\n";
    if (sink.send_head(403, "Forbidden", body.size(), "text/plain; charset=utf-8",
                       {{"X-Content-Type-Options", "nosniff"}})) {
        (void)sink.send_body(body.data(), body.size());
    }
    return RequestOutcome::Rejected;
}

bool TransferCoordinator::stream_body(int fd, std::uint64_t size, ResponseSink& sink, std::string& err) {
    std::vector<char> buf(_chunk);
    std::uint64_t sent = 0;
    while (sent < size) {
        std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(buf.size(), size - sent));
        ssize_t n = ::read(fd, buf.data(), want);
        if (n < 0) {
            if (errno == EINTR) continue;
            err = std::string("read failed: ") + std::strerror(errno);
            return false;
        }
        if (n == 0) {
            err = "file truncated while sending (" + std::to_string(sent) + " of " +
                  std::to_string(size) + " bytes)";
            return false;
        }
        if (!sink.send_body(buf.data(), static_cast<std::size_t>(n))) {
            err = "connection lost after " + std::to_string(sent) + " of " +
                  std::to_string(size) + " bytes";
            return false;
        }
        sent += static_cast<std::uint64_t>(n);
    }
    return true;
}

RequestOutcome TransferCoordinator::handle(const std::string& peer, bool head_only, ResponseSink& sink) {
    // Received
    const std::string client = client_id_from_peer(peer);

    // PolicyChecked
    const Decision d = _state.authorize(client);
    if (!d.allowed) {
        return reject(client, d.reason, sink);
    }

    // Streaming
    emit(client, vr::ActivityKind::Allowed, "Connected & Allowed");

    int fd = ::open(_file_path.c_str(), O_RDONLY | O_CLOEXEC);
    int open_err = fd < 0 ? errno : 0;
    struct stat st{};
    if (fd >= 0 && ::fstat(fd, &st) != 0) {
        open_err = errno;
        ::close(fd);
        fd = -1;
    }
    if (fd < 0) {
        const std::string why = std::strerror(open_err);
        _state.release(d);
        emit(client, vr::ActivityKind::Error, "Error opening file: " + why);
        vr::log_line("[500] ip=" + client + " open " + _file_path + ": " + why);
        const std::string body = "Internal Server Error\n";
        if (sink.send_head(500, "Internal Server Error", body.size(),
                           "text/plain; charset=utf-8",
                           {{"X-Content-Type-Options", "nosniff"}})) {
            (void)sink.send_body(body.data(), body.size());
        }
        return RequestOutcome::ServerError;
    }

    const std::uint64_t size = static_cast<std::uint64_t>(st.st_size);
    HeaderList extra{
        {"Content-Disposition", "attachment; filename=" + quote_string(_file_name)}
    };

    std::string err;
    bool ok = sink.send_head(200, "OK", size, "application/octet-stream", extra);
    if (!ok) {
        err = "connection lost before headers were sent";
    } else if (!head_only) {
        ok = stream_body(fd, size, sink, err);
    }
    ::close(fd);

    // TransferFailed
    if (!ok) {
        _state.release(d);
        emit(client, vr::ActivityKind::Failed, "Error during transfer: " + err);
        vr::log_line("[ERR] ip=" + client + " transfer: " + err);
        return RequestOutcome::TransferFailed;
    }

    if (head_only) {
        _state.release(d);
        return RequestOutcome::HeadOnly;
    }

    // TransferComplete -> Accounted
    const Completion c = _state.record_completion();
    emit(client, vr::ActivityKind::Completed, "Download Complete");
    vr::log_line("[200] ip=" + client + " bytes=" + std::to_string(size) +
                 " completed=" + std::to_string(c.count) +
                 (c.counted ? "" : " (quota already closed)"));
    if (c.reached_limit && _on_limit_reached) {
        _on_limit_reached();
    }
    return RequestOutcome::Completed;
}

} // namespace vr::internal
