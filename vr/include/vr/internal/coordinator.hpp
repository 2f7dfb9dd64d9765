/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include "vr/server_config.hpp"
#include "vr/types.hpp"
#include "vr/internal/activity_channel.hpp"
#include "vr/internal/session_state.hpp"

namespace vr::internal {

enum class RequestOutcome {
    Rejected,        // 403, no state change
    ServerError,     // 500, file could not be opened
    TransferFailed,  // headers or body could not be delivered
    Completed,       // full body delivered and accounted
    HeadOnly         // HEAD granted, nothing to account
};

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Where a response goes. Implemented over a socket by the HTTP layer and
// by an in-memory fake in tests. Both calls return false on a transport
// error; the coordinator never retries.
class ResponseSink {
public:
    virtual ~ResponseSink() = default;

    virtual bool send_head(int sc,
                           const char* st,
                           std::uint64_t content_len,
                           const char* ctype,
                           const HeaderList& extra) = 0;

    virtual bool send_body(const char* d, std::size_t n) = 0;
};

// "10.0.0.1:5123" -> "10.0.0.1", "[::1]:80" -> "::1".
// Anything unparsable is returned as-is.
std::string client_id_from_peer(const std::string& peer);

// Per-request lifecycle: identity, policy check, streaming, accounting
// and the shutdown trigger. Shared by all connection handlers.
class TransferCoordinator {
public:
    TransferCoordinator(const vr::ServerConfig& cfg,
                        SessionState& state,
                        ActivityChannel& activity,
                        std::function<void()> on_limit_reached);

    RequestOutcome handle(const std::string& peer, bool head_only, ResponseSink& sink);

private:
    std::string _file_path;
    std::string _file_name;
    std::size_t _chunk = 64 * 1024;
    SessionState& _state;
    ActivityChannel& _activity;
    std::function<void()> _on_limit_reached;

    void emit(const std::string& client, vr::ActivityKind kind, std::string msg);
    RequestOutcome reject(const std::string& client, const std::string& reason, ResponseSink& sink);
    bool stream_body(int fd, std::uint64_t size, ResponseSink& sink, std::string& err);
};

} // namespace vr::internal
