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

// Plain HTTP request structure as produced by our parser.
struct HttpRequest {
    std::string method;   // "GET", "POST", ... exactly as received
    std::string path;     // "/echo", the signed path (no query)
    std::string query;    // "a=1&b=2", not signed
    std::string httpver;  // "HTTP/1.1"
    HeaderMap   headers;
    std::string body;     // fully buffered raw payload
};

} // namespace hg
