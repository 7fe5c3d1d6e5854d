/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#pragma once
#include <ctime>
#include <string>

namespace hg {
// Return current UTC timestamp in strict ISO8601 "YYYY-MM-DDTHH:MM:SSZ".
std::string utc_iso8601_now();

// Same format for an explicit time point.
std::string utc_iso8601(std::time_t t);
} // namespace hg
