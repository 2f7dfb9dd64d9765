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
#include <string>
#include <unordered_map>

namespace vr::test {

struct HttpResponse {
    int status_code = 0;
    std::string status_text;
    std::unordered_map<std::string, std::string> headers;
    std::string body;
};

// Simple RAII for a blocking TCP client socket
class TcpConn {
public:
    TcpConn() = default;
    ~TcpConn(){ close(); }

    TcpConn(const TcpConn&) = delete;
    TcpConn& operator=(const TcpConn&) = delete;

    bool open(const std::string& host, uint16_t port, int timeout_sec = 5);
    void close();
    int  fd() const { return _fd; }

    bool send_all(const char* d, std::size_t len);
    bool recv_exact(char* d, std::size_t len);
    bool recv_until(std::string& out, const std::string& delim, std::size_t max_total = (1u<<20));

private:
    int _fd = -1;
};

// Send one request on c and read the response (Content-Length framed).
// HEAD responses carry no body.
bool http_request(TcpConn& c, const std::string& method, const std::string& path,
                  HttpResponse& out, bool keep_alive = false);

// One request on a fresh connection to 127.0.0.1:port.
bool http_once(uint16_t port, const std::string& method, const std::string& path,
               HttpResponse& out);

// Header lookup ignoring case.
std::string header(const HttpResponse& r, const char* name);

} // namespace vr::test
