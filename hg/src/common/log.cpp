/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#include "hg/log.hpp"
#include "hg/internal/time.hpp"
#include "hg/internal/utils.hpp"
#include <mutex>
#include <fstream>
#include <iostream>

namespace {
std::mutex g_log_mtx;
std::ofstream g_log_ofs;
std::string g_log_path;
hg::LogLevel g_min_level = hg::LogLevel::Info;
bool g_to_stdout = true;

const char* level_tag(hg::LogLevel l) {
    switch (l) {
        case hg::LogLevel::Debug: return "[DEBUG]";
        case hg::LogLevel::Info:  return "[INFO]";
        case hg::LogLevel::Warn:  return "[WARN]";
        case hg::LogLevel::Error: return "[ERROR]";
    }
    return "[INFO]";
}

void open_if_needed_unlocked() {
    if (!g_log_path.empty() && !g_log_ofs.is_open()) {
        g_log_ofs.open(g_log_path, std::ios::out | std::ios::app);
    }
}
} // namespace

namespace hg {

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_log_path = path;
    if (g_log_ofs.is_open()) {
        g_log_ofs.close();
    }
    open_if_needed_unlocked();
}

void set_log_level(LogLevel min_level) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_min_level = min_level;
}

void set_log_stdout(bool enabled) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_to_stdout = enabled;
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    const std::string n = internal::lower_copy(name);
    if (n == "debug")                  { out = LogLevel::Debug; return true; }
    if (n == "info")                   { out = LogLevel::Info;  return true; }
    if (n == "warn" || n == "warning") { out = LogLevel::Warn;  return true; }
    if (n == "error")                  { out = LogLevel::Error; return true; }
    return false;
}

void log_line(LogLevel level, const std::string& line) {
    const std::string full = utc_iso8601_now() + " " + level_tag(level) + " " + line;

    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (level < g_min_level) return;
    open_if_needed_unlocked();
    if (g_log_ofs.is_open() && g_log_ofs) {
        g_log_ofs << full << '\n';
        g_log_ofs.flush();
    }
    if (g_to_stdout) {
        std::cout << full << '\n';
    }
}

} // namespace hg
