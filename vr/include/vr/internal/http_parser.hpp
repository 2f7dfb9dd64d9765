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
#include "vr/http_request.hpp"

namespace vr::internal {

// Parse "GET /path?x=1 HTTP/1.1"
bool parse_request_line(const std::string& line, vr::HttpRequest& r);

// Parse a full header block (request line + headers, without the final
// blank line) into r. Returns false on a malformed request line.
bool parse_request_head(const std::string& head, vr::HttpRequest& r);

// Case-insensitive header lookup
std::string hdr_ci(const vr::HttpRequest& R, const char* name);

} // namespace vr::internal
