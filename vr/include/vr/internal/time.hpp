/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <string>

namespace vr {
// Local wall-clock time of tp as "HH:MM:SS".
std::string local_hms(std::chrono::system_clock::time_point tp);
} // namespace vr
