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
#include <string>
#include "hg/types.hpp"
#include "hg/http_request.hpp"
#include "hg/http_response.hpp"

namespace hg::internal {

// Parse "GET /path?x=1 HTTP/1.1"
bool parse_request_line(const std::string& line, hg::HttpRequest& r);

// Parse "Name: value" lines separated by CRLF (no status/request line).
// Lines without a colon are skipped.
void parse_header_lines(const std::string& block, HeaderMap& out);

// Parse a request head (request line + headers, without the blank line).
bool parse_request_head(const std::string& head, hg::HttpRequest& r);

// Parse an HTTP/1.x response head. hdr_end_off is set to the offset of the
// first body byte.
bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         hg::HttpResponse& out);

// Content-Length header: false when present but not a plain decimal number.
// has_length is false when the header is absent.
bool parse_content_length(const HeaderMap& H, bool& has_length, std::size_t& out);

// HTTP/1.1 defaults to keep-alive unless "Connection: close"; HTTP/1.0 only
// with "Connection: keep-alive".
bool should_keep_alive(const std::string& httpver, const HeaderMap& H);

} // namespace hg::internal
