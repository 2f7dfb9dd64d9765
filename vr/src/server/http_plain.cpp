/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#include "vr/server_config.hpp"
#include "vr/http_request.hpp"
#include "vr/internal/http_parser.hpp"
#include "vr/internal/utils.hpp"
#include "vr/internal/coordinator.hpp"
#include "vr/internal/conn_registry.hpp"
#include "vr/log.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <unistd.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>

namespace vr::internal {

// --- HTTP/1.1 keep-alive helpers ---

static bool is_http11(const std::string& ver) {
    return ver == "HTTP/1.1";
}

static bool should_keep_alive(const vr::HttpRequest& R) {
    std::string conn = lower_copy(hdr_ci(R, "Connection"));
    if (is_http11(R.httpver)) {
        return (conn != "close");
    } else {
        return (conn == "keep-alive");
    }
}

// --- I/O helpers ---

static bool send_all(int fd, const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(fd, d + off, len - off, MSG_NOSIGNAL);
        if (n <= 0) return false;
        off += static_cast<std::size_t>(n);
    }
    return true;
}

static void build_common_headers(std::ostringstream& oss,
                                 const vr::ServerConfig& cfg,
                                 std::uint64_t content_len,
                                 bool keep_alive)
{
    oss << "Content-Length: " << content_len << "\r\n";
    if (keep_alive) {
        oss << "Connection: keep-alive\r\n";
        oss << "Keep-Alive: timeout=" << cfg.ka_timeout_sec
            << ", max=" << cfg.ka_max << "\r\n";
    } else {
        oss << "Connection: close\r\n";
    }
}

static std::string build_head(const vr::ServerConfig& cfg,
                              int sc,
                              const char* st,
                              std::uint64_t content_len,
                              const char* ctype,
                              const HeaderList& extra_hdrs,
                              bool keep_alive)
{
    std::ostringstream oss;
    oss << "HTTP/1.1 " << sc << " " << st << "\r\n";
    oss << "Content-Type: " << ctype << "\r\n";
    for (const auto& kv : extra_hdrs) {
        oss << kv.first << ": " << kv.second << "\r\n";
    }
    build_common_headers(oss, cfg, content_len, keep_alive);
    oss << "\r\n";
    return oss.str();
}

static void send_http_resp(int fd,
                           const vr::ServerConfig& cfg,
                           int sc,
                           const char* st,
                           const std::string& body,
                           bool keep_alive,
                           const HeaderList& extra_hdrs = {})
{
    const std::string h = build_head(cfg, sc, st, body.size(), "text/plain; charset=utf-8",
                                     extra_hdrs, keep_alive);
    if (!send_all(fd, h.data(), h.size())) return;
    (void)send_all(fd, body.data(), body.size());
}

// Response sink over a connected socket.
class SocketSink : public ResponseSink {
public:
    SocketSink(int fd, const vr::ServerConfig& cfg, bool keep_alive, bool head_only)
        : _fd(fd), _cfg(cfg), _ka(keep_alive), _head_only(head_only) {}

    bool send_head(int sc, const char* st, std::uint64_t content_len,
                   const char* ctype, const HeaderList& extra) override
    {
        const std::string h = build_head(_cfg, sc, st, content_len, ctype, extra, _ka);
        return send_all(_fd, h.data(), h.size());
    }

    bool send_body(const char* d, std::size_t n) override {
        if (_head_only) return true;
        return send_all(_fd, d, n);
    }

private:
    int _fd;
    const vr::ServerConfig& _cfg;
    bool _ka;
    bool _head_only;
};

enum class RecvStatus { Ok, Closed, Malformed, TooLarge };

// Reads one request head. Bytes after the head (pipelined requests) stay
// in `pending` for the next call. Request bodies are read and discarded.
static RecvStatus recv_http_request(int fd,
                                    const vr::ServerConfig& cfg,
                                    vr::HttpRequest& R,
                                    std::string& pending)
{
    char buf[1024];
    while (pending.find("\r\n\r\n") == std::string::npos) {
        if (pending.size() > cfg.max_header_bytes) return RecvStatus::TooLarge;
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return RecvStatus::Closed;
        pending.append(buf, buf + n);
    }
    std::size_t hdr_end = pending.find("\r\n\r\n");
    if (hdr_end > cfg.max_header_bytes) return RecvStatus::TooLarge;
    const std::string head = pending.substr(0, hdr_end);
    pending.erase(0, hdr_end + 4);

    if (!parse_request_head(head, R)) return RecvStatus::Malformed;

    if (!hdr_ci(R, "Transfer-Encoding").empty()) return RecvStatus::Malformed;
    std::size_t content_len = 0;
    const std::string cl = hdr_ci(R, "Content-Length");
    if (!cl.empty()) {
        try {
            content_len = static_cast<std::size_t>(std::stoul(cl));
        } catch (const std::exception&) {
            return RecvStatus::Malformed;
        }
        if (content_len > cfg.max_header_bytes) return RecvStatus::TooLarge;
    }

    // discard body
    std::size_t have = std::min(content_len, pending.size());
    pending.erase(0, have);
    content_len -= have;
    while (content_len > 0) {
        ssize_t n = ::recv(fd, buf, std::min(sizeof(buf), content_len), 0);
        if (n <= 0) return RecvStatus::Closed;
        content_len -= static_cast<std::size_t>(n);
    }
    return RecvStatus::Ok;
}

// --- Per-request dispatcher (plain TCP) ---

static bool dispatch_request_plain(int fd,
                                   const vr::ServerConfig& cfg,
                                   const std::string& peer,
                                   const vr::HttpRequest& R,
                                   TransferCoordinator& coord,
                                   bool ka)
{
    if (R.method != "GET" && R.method != "HEAD") {
        send_http_resp(fd, cfg, 405, "Method Not Allowed",
                       "Method Not Allowed\n", ka, {{"Allow", "GET, HEAD"}});
        return ka;
    }

    if (R.path != "/") {
        send_http_resp(fd, cfg, 404, "Not Found", "404 page not found\n", ka);
        return ka;
    }

    const bool head_only = (R.method == "HEAD");
    SocketSink sink(fd, cfg, ka, head_only);
    RequestOutcome out = coord.handle(peer, head_only, sink);
    if (out == RequestOutcome::TransferFailed) {
        return false;
    }
    return ka;
}

// --- Exported entry point for server.cpp ---

void handle_connection_plain(int fd,
                             const vr::ServerConfig& cfg,
                             const std::string& peer,
                             TransferCoordinator& coord,
                             ConnectionRegistry& conns)
{
    // Per-connection kernel timeouts: idle keep-alive on receive, a
    // separate, longer one for streaming the file.
    timeval rcv{cfg.ka_timeout_sec, 0};
    timeval snd{cfg.send_timeout_sec, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &rcv, sizeof(rcv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &snd, sizeof(snd));

    std::string pending;
    int served = 0;
    while (served < cfg.ka_max) {
        if (!conns.set_idle(fd)) break;
        vr::HttpRequest R;
        RecvStatus rs = recv_http_request(fd, cfg, R, pending);
        conns.set_busy(fd);

        if (rs == RecvStatus::Closed) break;
        if (rs == RecvStatus::Malformed) {
            send_http_resp(fd, cfg, 400, "Bad Request", "400 Bad Request\n", false);
            break;
        }
        if (rs == RecvStatus::TooLarge) {
            send_http_resp(fd, cfg, 431, "Request Header Fields Too Large",
                           "431 Request Header Fields Too Large\n", false);
            break;
        }

        // No keep-alive once shutdown has begun.
        bool ka = should_keep_alive(R) && !conns.closing() && served + 1 < cfg.ka_max;
        bool ka_next = dispatch_request_plain(fd, cfg, peer, R, coord, ka);
        ++served;
        if (!ka_next) break;
    }
}

} // namespace vr::internal
