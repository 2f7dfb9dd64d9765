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
#include <system_error>
#include <thread>
#include <utility>
#include <vector>
#include "vr/log.hpp"

namespace vr::internal {

// Runs fn on a new thread appended to pool. Returns false, leaving pool
// unchanged, when the thread cannot be created.
template <class Fn>
bool spawn_worker(std::vector<std::thread>& pool, Fn&& fn) {
    try {
        pool.emplace_back(std::forward<Fn>(fn));
    } catch (const std::system_error& e) {
        vr::log_line(std::string("[ERROR] cannot start connection thread: ") + e.what());
        return false;
    }
    return true;
}

} // namespace vr::internal
