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
#include <vector>

namespace vr::internal {

// Non-loopback, non-link-local interface addresses, IPv4 first.
// Falls back to {"127.0.0.1"} when nothing else is found.
std::vector<std::string> outbound_addresses();

// "http://<addr>:<port>/" for every outbound address, plus localhost.
std::vector<std::string> serving_urls(uint16_t port);

} // namespace vr::internal
