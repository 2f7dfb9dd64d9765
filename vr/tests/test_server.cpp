/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#include "doctest/doctest.h"
#include "vr/server.hpp"
#include "vr/errors.hpp"
#include "http_test_client.hpp"
#include "test_support.hpp"

#include <chrono>
#include <string>
#include <thread>

#include <sys/socket.h>

using namespace vr;
using vr::test::HttpResponse;
using vr::test::TcpConn;
using vr::test::TempFile;
using vr::test::http_once;
using vr::test::http_request;
using vr::test::make_payload;

static ServerConfig base_cfg(const std::string& path) {
    ServerConfig cfg;
    cfg.file_path = path;
    cfg.port = 0;
    cfg.grace_sec = 5;
    cfg.ka_timeout_sec = 2;
    return cfg;
}

DOCTEST_TEST_CASE("serve-once over loopback: download, then the server stops itself") {
    const std::string payload = make_payload(256 * 1024);
    TempFile f(payload);
    ServerConfig cfg = base_cfg(f.path());
    cfg.access = make_access_config(1, "");

    Server srv(cfg);
    srv.start();
    DOCTEST_REQUIRE(srv.port() != 0);
    DOCTEST_CHECK(srv.snapshot().server_ready);

    HttpResponse r;
    DOCTEST_REQUIRE(http_once(srv.port(), "GET", "/", r));
    DOCTEST_CHECK_EQ(r.status_code, 200);
    DOCTEST_CHECK(r.body == payload);
    DOCTEST_CHECK_EQ(vr::test::header(r, "Content-Type"), "application/octet-stream");
    DOCTEST_CHECK(vr::test::header(r, "Content-Disposition").find("attachment") == 0);

    srv.wait();

    StatusSnapshot s = srv.snapshot();
    DOCTEST_CHECK(s.quitting);
    DOCTEST_CHECK(s.shutdown_reason == ShutdownReason::LimitReached);
    DOCTEST_CHECK_EQ(s.completed, 1u);
    DOCTEST_CHECK(s.last_error.empty());
    DOCTEST_REQUIRE_EQ(s.activity.size(), 3u);
    DOCTEST_CHECK_EQ(s.activity[0].message, "Connected & Allowed");
    DOCTEST_CHECK_EQ(s.activity[1].message, "Download Complete");
    DOCTEST_CHECK_EQ(s.activity[2].client, "Server");

    // Listener is gone.
    TcpConn c;
    DOCTEST_CHECK_FALSE(c.open("127.0.0.1", srv.port(), 1));
}

DOCTEST_TEST_CASE("whitelist refuses an unlisted client with 403") {
    TempFile f(make_payload(1024));
    ServerConfig cfg = base_cfg(f.path());
    cfg.access = make_access_config(1, "10.254.254.254");

    Server srv(cfg);
    srv.start();

    HttpResponse r;
    DOCTEST_REQUIRE(http_once(srv.port(), "GET", "/", r));
    DOCTEST_CHECK_EQ(r.status_code, 403);
    DOCTEST_CHECK_EQ(r.body, "IP not in allowed list\n");

    srv.stop();
    srv.wait();
    StatusSnapshot s = srv.snapshot();
    DOCTEST_CHECK(s.shutdown_reason == ShutdownReason::Manual);
    DOCTEST_CHECK_EQ(s.completed, 0u);
}

DOCTEST_TEST_CASE("keep-alive connection: HEAD, 404, 405 and GET") {
    const std::string payload = make_payload(10000);
    TempFile f(payload);
    ServerConfig cfg = base_cfg(f.path());
    cfg.access = make_access_config(0, "127.0.0.1");

    Server srv(cfg);
    srv.start();

    TcpConn c;
    DOCTEST_REQUIRE(c.open("127.0.0.1", srv.port()));

    HttpResponse head;
    DOCTEST_REQUIRE(http_request(c, "HEAD", "/", head, true));
    DOCTEST_CHECK_EQ(head.status_code, 200);
    DOCTEST_CHECK_EQ(vr::test::header(head, "Content-Length"), std::to_string(payload.size()));

    HttpResponse missing;
    DOCTEST_REQUIRE(http_request(c, "GET", "/favicon.ico", missing, true));
    DOCTEST_CHECK_EQ(missing.status_code, 404);

    HttpResponse post;
    DOCTEST_REQUIRE(http_request(c, "POST", "/", post, true));
    DOCTEST_CHECK_EQ(post.status_code, 405);
    DOCTEST_CHECK_EQ(vr::test::header(post, "Allow"), "GET, HEAD");

    HttpResponse get;
    DOCTEST_REQUIRE(http_request(c, "GET", "/", get, true));
    DOCTEST_CHECK_EQ(get.status_code, 200);
    DOCTEST_CHECK(get.body == payload);
    c.close();

    srv.stop();
    srv.wait();
    DOCTEST_CHECK_EQ(srv.snapshot().completed, 1u);
}

DOCTEST_TEST_CASE("a downloader that stalls longer than the keep-alive timeout still gets the file") {
    const std::string payload = make_payload(8 * 1024 * 1024);
    TempFile f(payload);
    ServerConfig cfg = base_cfg(f.path());
    cfg.access = make_access_config(1, "");
    cfg.ka_timeout_sec = 1;
    cfg.send_timeout_sec = 30;

    Server srv(cfg);
    srv.start();

    TcpConn c;
    DOCTEST_REQUIRE(c.open("127.0.0.1", srv.port(), 30));
    const std::string req = "GET / HTTP/1.1\r\nHost: 127.0.0.1\r\nConnection: close\r\n\r\n";
    DOCTEST_REQUIRE(c.send_all(req.data(), req.size()));

    // Leave the server blocked in send() past the keep-alive timeout.
    std::this_thread::sleep_for(std::chrono::milliseconds(2500));

    std::string head;
    DOCTEST_REQUIRE(c.recv_until(head, "\r\n\r\n"));
    DOCTEST_CHECK(head.rfind("HTTP/1.1 200", 0) == 0);
    const std::size_t body_off = head.find("\r\n\r\n") + 4;
    std::string body = head.substr(body_off);
    DOCTEST_REQUIRE(body.size() <= payload.size());
    const std::size_t have = body.size();
    body.resize(payload.size());
    DOCTEST_REQUIRE(c.recv_exact(&body[have], payload.size() - have));
    DOCTEST_CHECK(body == payload);

    srv.wait();
    DOCTEST_CHECK_EQ(srv.snapshot().completed, 1u);
}

DOCTEST_TEST_CASE("idle keep-alive connections do not hold up shutdown") {
    TempFile f(make_payload(64));
    ServerConfig cfg = base_cfg(f.path());
    cfg.access = make_access_config(3, "");
    cfg.ka_timeout_sec = 30;

    Server srv(cfg);
    srv.start();

    TcpConn c;
    DOCTEST_REQUIRE(c.open("127.0.0.1", srv.port(), 10));
    HttpResponse r;
    DOCTEST_REQUIRE(http_request(c, "GET", "/nothing", r, true));
    DOCTEST_CHECK_EQ(r.status_code, 404);

    const auto t0 = std::chrono::steady_clock::now();
    srv.stop();
    DOCTEST_CHECK_NOTHROW(srv.wait());
    DOCTEST_CHECK(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(4));
}

DOCTEST_TEST_CASE("stop is idempotent") {
    TempFile f(make_payload(64));
    ServerConfig cfg = base_cfg(f.path());

    Server srv(cfg);
    srv.start();
    srv.stop();
    srv.stop();
    srv.wait();
    srv.stop();
    srv.wait();
    DOCTEST_CHECK(srv.snapshot().shutdown_reason == ShutdownReason::Manual);
}

DOCTEST_TEST_CASE("second server on a taken port fails with BindError") {
    TempFile f(make_payload(64));
    ServerConfig cfg = base_cfg(f.path());

    Server first(cfg);
    first.start();

    ServerConfig taken = cfg;
    taken.port = first.port();
    Server second(taken);
    DOCTEST_CHECK_THROWS_AS(second.start(), BindError);

    first.stop();
    first.wait();
}

DOCTEST_TEST_CASE("missing file is a configuration error") {
    ServerConfig cfg = base_cfg("/nonexistent/vr_missing_file.bin");
    DOCTEST_CHECK_THROWS_AS(Server{cfg}, ConfigError);
}

DOCTEST_TEST_CASE("transfer outliving the grace period makes shutdown fail") {
    TempFile f(make_payload(32 * 1024 * 1024));
    ServerConfig cfg = base_cfg(f.path());
    cfg.grace_sec = 0;
    cfg.ka_timeout_sec = 30;

    Server srv(cfg);
    srv.start();

    // Request the file and never read it; the server blocks in send().
    TcpConn c;
    DOCTEST_REQUIRE(c.open("127.0.0.1", srv.port(), 30));
    int small = 4096;
    setsockopt(c.fd(), SOL_SOCKET, SO_RCVBUF, &small, sizeof(small));
    const std::string req = "GET / HTTP/1.1\r\nHost: 127.0.0.1\r\n\r\n";
    DOCTEST_REQUIRE(c.send_all(req.data(), req.size()));

    DOCTEST_REQUIRE(srv.monitor().wait_for_count(1, std::chrono::seconds(5)));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    srv.stop();
    DOCTEST_CHECK_THROWS_AS(srv.wait(), ShutdownError);

    StatusSnapshot s = srv.snapshot();
    DOCTEST_CHECK_FALSE(s.last_error.empty());
    DOCTEST_CHECK_EQ(s.completed, 0u);
}
