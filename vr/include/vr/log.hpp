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

namespace vr {

// Thread-safe logging (to optional file + stdout).
// An empty path disables the file sink.
void set_log_file(const std::string& path);
void set_log_console(bool enabled);
void log_line(const std::string& line);

} // namespace vr
