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
#include <cstdint>
#include <string>

namespace vr {

// Access policy: who may download, and how many transfers close the server.
enum class AccessMode {
    Whitelist,
    FirstNUnique,
    ServeOnce
};

enum class ActivityKind {
    Allowed,
    Rejected,
    Completed,
    Failed,
    Error,
    Server
};

// One line of activity history. Immutable once created.
struct ActivityRecord {
    std::chrono::system_clock::time_point timestamp;
    std::string  client;   // client identifier, or "Server"
    ActivityKind kind = ActivityKind::Server;
    std::string  message;
};

enum class ShutdownReason {
    None,
    LimitReached,
    Manual
};

// The file being served, captured once at startup.
struct FileInfo {
    std::string   path;
    std::string   name;     // base name sent as the attachment filename
    std::uint64_t size = 0;
    std::string   sha256;   // lowercase hex
};

const char* to_string(AccessMode m);
const char* to_string(ShutdownReason r);

} // namespace vr
