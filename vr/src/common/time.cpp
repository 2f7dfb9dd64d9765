/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#include "vr/internal/time.hpp"
#include <ctime>
#include <cstdio>

namespace vr {

std::string local_hms(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[16]{0};
    const std::size_t n = std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
    return std::string(buf, n);
}

} // namespace vr
