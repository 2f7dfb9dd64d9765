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
#include "vr/types.hpp"

namespace vr::internal {

// Stat and hash the file to serve. Throws ConfigError if it is missing,
// not a regular file, or unreadable.
vr::FileInfo inspect_file(const std::string& path);

// SHA-256 of the whole file as lowercase hex (OpenSSL EVP, streamed).
// Returns false on read error.
bool sha256_file_hex(const std::string& path, std::string& out);

} // namespace vr::internal
