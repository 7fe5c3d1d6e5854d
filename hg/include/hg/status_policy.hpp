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
#include "hg/types.hpp"

namespace hg {

struct HttpStatus {
    int         code = 500;
    std::string text = "Internal Server Error";
};

// Which HTTP status the host answers a rejected request with.
struct StatusPolicy {
    HttpStatus missing_header        {401, "Unauthorized"};
    HttpStatus malformed_header      {400, "Bad Request"};
    HttpStatus authentication_failed {401, "Unauthorized"};
    HttpStatus body_read_error       {500, "Internal Server Error"};

    // Status for a rejection reason. AuthError::None maps to 200 OK.
    HttpStatus status_for(AuthError reason) const;

    // 401 / 400 / 401 / 500
    static StatusPolicy standard();

    // 403 for every client-caused rejection, 500 for body read failures.
    static StatusPolicy forbidden();
};

// "standard" or "forbidden". Returns false for any other name.
bool parse_status_policy(const std::string& name, StatusPolicy& out);

} // namespace hg
