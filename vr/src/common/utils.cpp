/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#include "vr/internal/utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace vr::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

std::string bytes_to_hex(const unsigned char* p, std::size_t n){
    static const char* H="0123456789abcdef";
    std::string s; s.resize(n*2);
    for(std::size_t i=0;i<n;++i){ s[2*i]=H[p[i]>>4]; s[2*i+1]=H[p[i]&0xF]; }
    return s;
}

std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::string format_bytes(std::uint64_t b) {
    const std::uint64_t unit = 1024;
    if (b < unit) return std::to_string(b) + " B";
    std::uint64_t div = unit;
    int exp = 0;
    for (std::uint64_t n = b / unit; n >= unit; n /= unit) {
        div *= unit;
        ++exp;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f %ciB",
                  static_cast<double>(b) / static_cast<double>(div), "KMGTPE"[exp]);
    return buf;
}

std::string quote_string(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (unsigned char c : s) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
            out.push_back((char)c);
        } else if (c < 0x20 || c == 0x7f) {
            static const char* H = "0123456789abcdef";
            out += "\\x";
            out.push_back(H[c >> 4]);
            out.push_back(H[c & 0xF]);
        } else {
            out.push_back((char)c);
        }
    }
    out.push_back('"');
    return out;
}

std::string base_name(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    std::size_t slash = p.find_last_of('/');
    if (slash == std::string::npos) return p;
    if (p.size() == 1) return p;
    return p.substr(slash + 1);
}

} // namespace vr::internal
