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
#include <cstdint>

namespace vr::internal {

// Trim spaces from both sides (in-place).
void trim_inplace(std::string& s);

std::string bytes_to_hex(const unsigned char* p, std::size_t n);

std::string lower_copy(std::string s);

// "1536" -> "1.5 KiB" (1024-based units).
std::string format_bytes(std::uint64_t b);

// Double-quoted string with '"' and '\' escaped and control bytes as \xNN,
// suitable for a Content-Disposition filename parameter.
std::string quote_string(const std::string& s);

// Last path component of "dir/sub/name.ext".
std::string base_name(const std::string& path);

} // namespace vr::internal
