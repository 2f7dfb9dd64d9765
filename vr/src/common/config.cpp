/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#include "vr/server_config.hpp"
#include "vr/errors.hpp"
#include "vr/log.hpp"
#include "vr/internal/utils.hpp"

namespace vr {

std::unordered_set<std::string> parse_ip_list(const std::string& csv) {
    std::unordered_set<std::string> out;
    std::size_t pos = 0;
    while (pos <= csv.size()) {
        std::size_t comma = csv.find(',', pos);
        if (comma == std::string::npos) comma = csv.size();
        std::string ip = csv.substr(pos, comma - pos);
        internal::trim_inplace(ip);
        if (!ip.empty()) out.insert(ip);
        pos = comma + 1;
    }
    return out;
}

AccessConfig make_access_config(int n, const std::string& ips_csv) {
    AccessConfig a;
    auto ips = parse_ip_list(ips_csv);
    if (!ips.empty()) {
        a.mode = AccessMode::Whitelist;
        a.whitelist = std::move(ips);
        // -n keeps its meaning; only n < 1 leaves the whitelist unbounded.
        a.limit = n >= 1 ? static_cast<std::uint32_t>(n) : 0;
        return a;
    }
    if (n > 1) {
        a.mode = AccessMode::FirstNUnique;
        a.limit = static_cast<std::uint32_t>(n);
        return a;
    }
    if (n < 1) {
        log_line("[WARN] -n must be 1 or greater. Defaulting to serve-once (n=1).");
    }
    a.mode = AccessMode::ServeOnce;
    a.limit = 1;
    return a;
}

void validate_config(const ServerConfig& cfg) {
    if (cfg.file_path.empty()) {
        throw ConfigError("no file specified");
    }
    switch (cfg.access.mode) {
        case AccessMode::Whitelist:
            if (cfg.access.whitelist.empty()) {
                throw ConfigError("whitelist mode requires at least one IP");
            }
            break;
        case AccessMode::FirstNUnique:
            if (cfg.access.limit < 1) {
                throw ConfigError("first-n-unique mode requires a limit of at least 1");
            }
            break;
        case AccessMode::ServeOnce:
            if (cfg.access.limit != 1) {
                throw ConfigError("serve-once mode requires a limit of 1");
            }
            break;
    }
    if (cfg.grace_sec < 0) {
        throw ConfigError("grace period must not be negative");
    }
    if (cfg.ka_timeout_sec < 1 || cfg.ka_max < 1) {
        throw ConfigError("keep-alive timeout and request cap must be at least 1");
    }
    if (cfg.send_timeout_sec < 1) {
        throw ConfigError("send timeout must be at least 1 second");
    }
    if (cfg.max_header_bytes < 1024) {
        throw ConfigError("header limit must be at least 1 KiB");
    }
    if (cfg.activity_history == 0 || cfg.activity_capacity == 0) {
        throw ConfigError("activity history and channel capacity must be non-zero");
    }
}

std::string describe_access(const AccessConfig& access) {
    switch (access.mode) {
        case AccessMode::Whitelist: {
            std::string s = "Locked to " + std::to_string(access.whitelist.size()) +
                            " specific IP(s)";
            if (access.limit > 0) {
                s += ", " + std::to_string(access.limit) + " download(s)";
            }
            return s;
        }
        case AccessMode::FirstNUnique:
            return "Serve to first " + std::to_string(access.limit) + " unique IPs";
        case AccessMode::ServeOnce:
            return "Serve once to first successful download";
    }
    return "unknown";
}

} // namespace vr
