/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#pragma once
#include <string>

namespace hg {

enum class LogLevel { Debug, Info, Warn, Error };

// Thread-safe logging (to optional file + stdout).
// Lines look like "2025-01-01T00:00:00Z [INFO] message".
void set_log_file(const std::string& path);   // "" = stdout only
void set_log_level(LogLevel min_level);
void set_log_stdout(bool enabled);

bool parse_log_level(const std::string& name, LogLevel& out);

void log_line(LogLevel level, const std::string& line);

inline void log_debug(const std::string& line) { log_line(LogLevel::Debug, line); }
inline void log_info (const std::string& line) { log_line(LogLevel::Info,  line); }
inline void log_warn (const std::string& line) { log_line(LogLevel::Warn,  line); }
inline void log_error(const std::string& line) { log_line(LogLevel::Error, line); }

} // namespace hg
