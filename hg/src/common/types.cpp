/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#include "hg/types.hpp"
#include <utility>

namespace hg {

const char* to_string(AuthError e) {
    switch (e) {
        case AuthError::None:                 return "NONE";
        case AuthError::MissingHeader:        return "MISSING_HEADER";
        case AuthError::MalformedHeader:      return "MALFORMED_HEADER";
        case AuthError::AuthenticationFailed: return "AUTHENTICATION_FAILED";
        case AuthError::BodyReadError:        return "BODY_READ_ERROR";
    }
    return "UNKNOWN";
}

AuthOutcome AuthOutcome::allow() {
    AuthOutcome o;
    o.state = AuthState::Allowed;
    return o;
}

AuthOutcome AuthOutcome::reject(AuthError reason, std::string detail) {
    AuthOutcome o;
    o.state  = AuthState::Rejected;
    o.reason = reason;
    o.detail = std::move(detail);
    return o;
}

} // namespace hg
