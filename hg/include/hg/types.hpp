/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#pragma once
#include <array>
#include <cstddef>
#include <map>
#include <string>

namespace hg {

// HMAC-SHA256 output.
constexpr std::size_t kDigestSize = 32;
using Digest = std::array<unsigned char, kDigestSize>;

// Header name -> raw value. Lookups go through internal::find_header_ci.
using HeaderMap = std::multimap<std::string, std::string>;

enum class AuthError {
    None,
    MissingHeader,         // signature header absent
    MalformedHeader,       // present, but not 64 lowercase hex chars
    AuthenticationFailed,  // well-formed, digest mismatch
    BodyReadError          // transport failed to deliver the body
};

// Stable reason code: "MISSING_HEADER", "MALFORMED_HEADER", ...
const char* to_string(AuthError e);

enum class AuthState {
    NotYetChecked,
    Allowed,
    Rejected
};

// Result of one verification. Default-constructed means nothing was checked,
// which is not an acceptance.
struct AuthOutcome {
    AuthState   state  = AuthState::NotYetChecked;
    AuthError   reason = AuthError::None;
    std::string detail;

    bool allowed() const noexcept { return state == AuthState::Allowed; }
    bool rejected() const noexcept { return state == AuthState::Rejected; }

    static AuthOutcome allow();
    static AuthOutcome reject(AuthError reason, std::string detail = {});
};

} // namespace hg
