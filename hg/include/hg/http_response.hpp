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

// Response as produced by an application handler (server side) or as parsed
// off the wire (client side). `body` is owned and is exactly what is sent.
struct HttpResponse {
    int status_code = 200;
    std::string status_text = "OK";
    HeaderMap headers;
    std::string body;

    // Client side only: verdict on the response signature header.
    AuthOutcome signature;
};

} // namespace hg
