/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include "hg/types.hpp"

namespace hg::internal {

// Trim spaces from both sides (in-place).
void trim_inplace(std::string& s);

// Hex helpers. Encoding is always lowercase; decoding accepts either case and
// fails on odd length or any non-hex character.
int  hexval(char c);
bool hex_to_bytes(const std::string& hex, std::string& out);
std::string bytes_to_hex(const unsigned char* p, std::size_t n);
std::string bytes_to_hex(const std::string& bytes);
std::string digest_to_hex(const Digest& d);

// True when s is non-empty and made only of [0-9a-f].
bool is_lower_hex(const std::string& s);

// Constant-time equality. Differing lengths return false straight away
// (lengths are not secret); equal lengths are compared in full.
bool ct_equal(const void* a, std::size_t na, const void* b, std::size_t nb);
bool ct_equal(const std::string& a, const std::string& b);

std::string lower_copy(std::string s);

// Case-insensitive header lookup. Returns the first matching value in map
// order, whatever the case of the stored name, or nullptr.
const std::string* find_header_ci(const HeaderMap& H, const std::string& name);

// Value of the header or "" when absent.
std::string hdr_ci(const HeaderMap& H, const std::string& name);

// Drop every header named `name` (any case) and insert name: value.
void set_header_ci(HeaderMap& H, const std::string& name, const std::string& value);

// Decimal TCP port, 1..65535 (0 too when allow_zero). Anything else, signs
// and surrounding spaces included, returns false and leaves out untouched.
bool parse_port(const std::string& s, bool allow_zero, std::uint16_t& out);

// Securely wipe string contents
void secure_wipe(std::string& s);

} // namespace hg::internal
