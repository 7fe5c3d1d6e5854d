/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#include "hg/status_policy.hpp"
#include "hg/internal/utils.hpp"

namespace hg {

HttpStatus StatusPolicy::status_for(AuthError reason) const {
    switch (reason) {
        case AuthError::None:                 return HttpStatus{200, "OK"};
        case AuthError::MissingHeader:        return missing_header;
        case AuthError::MalformedHeader:      return malformed_header;
        case AuthError::AuthenticationFailed: return authentication_failed;
        case AuthError::BodyReadError:        return body_read_error;
    }
    return HttpStatus{};
}

StatusPolicy StatusPolicy::standard() {
    return StatusPolicy{};
}

StatusPolicy StatusPolicy::forbidden() {
    StatusPolicy p;
    p.missing_header        = HttpStatus{403, "Forbidden"};
    p.malformed_header      = HttpStatus{403, "Forbidden"};
    p.authentication_failed = HttpStatus{403, "Forbidden"};
    return p;
}

bool parse_status_policy(const std::string& name, StatusPolicy& out) {
    const std::string n = internal::lower_copy(name);
    if (n == "standard") { out = StatusPolicy::standard(); return true; }
    if (n == "forbidden") { out = StatusPolicy::forbidden(); return true; }
    return false;
}

} // namespace hg
