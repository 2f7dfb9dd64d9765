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
#include <unordered_map>

namespace vr {

// Plain HTTP request structure as produced by our parser.
// Request bodies are never read: only GET and HEAD are served.
struct HttpRequest {
    std::string method;   // "GET", "HEAD", ...
    std::string path;     // "/"
    std::string query;    // "a=1&b=2"
    std::string httpver;  // "HTTP/1.1"
    std::unordered_map<std::string, std::string> headers;
};

} // namespace vr
