/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#pragma once
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace vr::test {

// File under /tmp removed on scope exit.
class TempFile {
public:
    explicit TempFile(const std::string& content) {
        char tmpl[] = "/tmp/vr_test_XXXXXX";
        int fd = ::mkstemp(tmpl);
        if (fd < 0) throw std::runtime_error("mkstemp failed");
        _path = tmpl;
        std::size_t off = 0;
        while (off < content.size()) {
            ssize_t n = ::write(fd, content.data() + off, content.size() - off);
            if (n <= 0) {
                ::close(fd);
                throw std::runtime_error("write failed");
            }
            off += static_cast<std::size_t>(n);
        }
        ::close(fd);
    }
    ~TempFile() { ::unlink(_path.c_str()); }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return _path; }

private:
    std::string _path;
};

// Deterministic, non-repeating-looking payload of n bytes.
inline std::string make_payload(std::size_t n) {
    std::string s(n, '\0');
    unsigned x = 2463534242u;
    for (std::size_t i = 0; i < n; ++i) {
        x ^= x << 13; x ^= x >> 17; x ^= x << 5;
        s[i] = static_cast<char>(x & 0xFF);
    }
    return s;
}

} // namespace vr::test
