/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#pragma once
#include <string>
#include <cstdint>
#include <cstddef>
#include <unordered_set>
#include "vr/types.hpp"

namespace vr {

struct AccessConfig {
    AccessMode mode = AccessMode::ServeOnce;

    // ServeOnce: always 1. FirstNUnique: number of unique clients and
    // number of downloads. Whitelist: 0 = unbounded downloads.
    std::uint32_t limit = 1;

    std::unordered_set<std::string> whitelist;
};

struct ServerConfig {
    // Core
    AccessConfig access;
    uint16_t     port = 0;          // 0 = pick an ephemeral port
    std::string  file_path;

    // Shutdown grace period for in-flight transfers
    int grace_sec = 10;

    // Keep-alive
    int ka_timeout_sec = 5;
    int ka_max         = 100;

    // A stalled reader may hold a transfer this long per write.
    int send_timeout_sec = 60;

    // Request header guard
    std::size_t max_header_bytes = 64 * 1024;

    // Observer
    std::size_t activity_history  = 10;
    std::size_t activity_capacity = 64;

    // Logging
    std::string log_file;
    bool        quiet = false;
};

// Builds the access section the same way the CLI flags are interpreted:
// a non-empty IP list locks the server to those IPs, otherwise n picks
// serve-once (n <= 1) or first-N-unique (n > 1).
AccessConfig make_access_config(int n, const std::string& ips_csv);

// Split "a, b,,c" into {"a","b","c"}.
std::unordered_set<std::string> parse_ip_list(const std::string& csv);

// Throws ConfigError on inconsistent input.
void validate_config(const ServerConfig& cfg);

// Human-readable access mode, e.g. "Serve to first 3 unique IPs".
std::string describe_access(const AccessConfig& access);

} // namespace vr
