/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#include "vr/internal/http_parser.hpp"
#include "vr/internal/utils.hpp"
#include <sstream>
#include <strings.h> // strcasecmp

namespace vr::internal {

bool parse_request_line(const std::string& line, vr::HttpRequest& r) {
    std::istringstream iss(line);
    std::string target, extra;
    if (!(iss >> r.method >> target >> r.httpver)) return false;
    if (iss >> extra) return false;
    if (r.httpver.rfind("HTTP/", 0) != 0) return false;
    if (target.empty()) return false;

    std::size_t q = target.find('?');
    if (q == std::string::npos) {
        r.path = target;
        r.query.clear();
    } else {
        r.path  = target.substr(0, q);
        r.query = target.substr(q + 1);
    }
    return true;
}

bool parse_request_head(const std::string& head, vr::HttpRequest& r) {
    std::size_t line_end = head.find("\r\n");
    if (line_end == std::string::npos) line_end = head.size();
    if (!parse_request_line(head.substr(0, line_end), r)) return false;

    r.headers.clear();
    std::size_t pos = line_end + 2;
    while (pos < head.size()) {
        std::size_t next = head.find("\r\n", pos);
        if (next == std::string::npos) next = head.size();
        std::string line = head.substr(pos, next - pos);
        pos = next + 2;
        std::size_t c = line.find(':');
        if (c != std::string::npos) {
            std::string k = line.substr(0, c), v = line.substr(c + 1);
            trim_inplace(k);
            trim_inplace(v);
            r.headers[k] = v;
        }
    }
    return true;
}

std::string hdr_ci(const vr::HttpRequest& R, const char* name){
    auto it = R.headers.find(name);
    if (it != R.headers.end()) return it->second;
    for (const auto& kv : R.headers){
        if (strcasecmp(kv.first.c_str(), name)==0) return kv.second;
    }
    return {};
}

} // namespace vr::internal
