/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#include "doctest/doctest.h"
#include "vr/server_config.hpp"
#include "vr/errors.hpp"

using namespace vr;

DOCTEST_TEST_CASE("make_access_config picks the mode from -n and -ips") {
    AccessConfig once = make_access_config(1, "");
    DOCTEST_CHECK_EQ(once.mode, AccessMode::ServeOnce);
    DOCTEST_CHECK_EQ(once.limit, 1u);

    AccessConfig bad_n = make_access_config(0, "");
    DOCTEST_CHECK_EQ(bad_n.mode, AccessMode::ServeOnce);
    DOCTEST_CHECK_EQ(bad_n.limit, 1u);

    AccessConfig many = make_access_config(3, "");
    DOCTEST_CHECK_EQ(many.mode, AccessMode::FirstNUnique);
    DOCTEST_CHECK_EQ(many.limit, 3u);

    AccessConfig wl = make_access_config(1, "10.0.0.1, 10.0.0.2");
    DOCTEST_CHECK_EQ(wl.mode, AccessMode::Whitelist);
    DOCTEST_CHECK_EQ(wl.limit, 1u);
    DOCTEST_CHECK_EQ(wl.whitelist.size(), 2u);

    AccessConfig wl_open = make_access_config(0, "10.0.0.1");
    DOCTEST_CHECK_EQ(wl_open.mode, AccessMode::Whitelist);
    DOCTEST_CHECK_EQ(wl_open.limit, 0u);

    AccessConfig wl_bounded = make_access_config(4, "10.0.0.1");
    DOCTEST_CHECK_EQ(wl_bounded.mode, AccessMode::Whitelist);
    DOCTEST_CHECK_EQ(wl_bounded.limit, 4u);
}

DOCTEST_TEST_CASE("parse_ip_list trims and skips empty entries") {
    auto ips = parse_ip_list(" 10.0.0.1 ,,10.0.0.2,  , 10.0.0.1");
    DOCTEST_CHECK_EQ(ips.size(), 2u);
    DOCTEST_CHECK(ips.count("10.0.0.1") == 1);
    DOCTEST_CHECK(ips.count("10.0.0.2") == 1);
    DOCTEST_CHECK(parse_ip_list("").empty());
    DOCTEST_CHECK(parse_ip_list(" , ").empty());
}

DOCTEST_TEST_CASE("an IP list of only separators falls back to the -n modes") {
    AccessConfig a = make_access_config(2, " , ");
    DOCTEST_CHECK_EQ(a.mode, AccessMode::FirstNUnique);
}

DOCTEST_TEST_CASE("validate_config rejects inconsistent settings") {
    ServerConfig cfg;
    cfg.file_path = "/tmp/x";
    DOCTEST_CHECK_NOTHROW(validate_config(cfg));

    ServerConfig no_file = cfg;
    no_file.file_path.clear();
    DOCTEST_CHECK_THROWS_AS(validate_config(no_file), ConfigError);

    ServerConfig empty_wl = cfg;
    empty_wl.access.mode = AccessMode::Whitelist;
    empty_wl.access.limit = 0;
    DOCTEST_CHECK_THROWS_AS(validate_config(empty_wl), ConfigError);

    ServerConfig zero_n = cfg;
    zero_n.access.mode = AccessMode::FirstNUnique;
    zero_n.access.limit = 0;
    DOCTEST_CHECK_THROWS_AS(validate_config(zero_n), ConfigError);

    ServerConfig once_many = cfg;
    once_many.access.limit = 2;
    DOCTEST_CHECK_THROWS_AS(validate_config(once_many), ConfigError);

    ServerConfig neg_grace = cfg;
    neg_grace.grace_sec = -1;
    DOCTEST_CHECK_THROWS_AS(validate_config(neg_grace), ConfigError);

    ServerConfig no_send_timeout = cfg;
    no_send_timeout.send_timeout_sec = 0;
    DOCTEST_CHECK_THROWS_AS(validate_config(no_send_timeout), ConfigError);

    ServerConfig no_history = cfg;
    no_history.activity_capacity = 0;
    DOCTEST_CHECK_THROWS_AS(validate_config(no_history), ConfigError);
}

DOCTEST_TEST_CASE("describe_access") {
    DOCTEST_CHECK_EQ(describe_access(make_access_config(1, "")),
                     "Serve once to first successful download");
    DOCTEST_CHECK_EQ(describe_access(make_access_config(5, "")),
                     "Serve to first 5 unique IPs");
    DOCTEST_CHECK_EQ(describe_access(make_access_config(0, "a,b")),
                     "Locked to 2 specific IP(s)");
    DOCTEST_CHECK_EQ(describe_access(make_access_config(1, "a,b")),
                     "Locked to 2 specific IP(s), 1 download(s)");
    DOCTEST_CHECK_EQ(describe_access(make_access_config(3, "a")),
                     "Locked to 1 specific IP(s), 3 download(s)");
}
