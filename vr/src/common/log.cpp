/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#include "vr/log.hpp"
#include <mutex>
#include <fstream>
#include <iostream>

namespace {
std::mutex g_log_mtx;
std::ofstream g_log_ofs;
std::string g_log_path;
bool g_console = true;
} // namespace

namespace vr {

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_log_path = path;
    if (g_log_ofs.is_open()) {
        g_log_ofs.close();
    }
    if (!g_log_path.empty()) {
        g_log_ofs.open(g_log_path, std::ios::out | std::ios::app);
        if (!g_log_ofs && g_console) {
            std::cerr << "[WARN] cannot open log file " << g_log_path << '\n';
        }
    }
}

void set_log_console(bool enabled) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_console = enabled;
}

void log_line(const std::string& line) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open() && g_log_ofs) {
        g_log_ofs << line << '\n';
        g_log_ofs.flush();
    }
    if (g_console) {
        std::cout << line << '\n';
    }
}

} // namespace vr
