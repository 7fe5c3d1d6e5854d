/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#include "hg/internal/http_parser.hpp"
#include "hg/internal/utils.hpp"
#include <limits>
#include <sstream>
#include <utility>

namespace hg::internal {

bool parse_request_line(const std::string& line, hg::HttpRequest& r) {
    const std::size_t sp1 = line.find(' ');
    if (sp1 == std::string::npos || sp1 == 0) return false;
    const std::size_t sp2 = line.find(' ', sp1 + 1);
    if (sp2 == std::string::npos || sp2 == sp1 + 1) return false;
    if (line.find(' ', sp2 + 1) != std::string::npos) return false;

    std::string method  = line.substr(0, sp1);
    std::string target  = line.substr(sp1 + 1, sp2 - sp1 - 1);
    std::string httpver = line.substr(sp2 + 1);

    if (target.empty() || target[0] != '/') return false;
    if (httpver.compare(0, 5, "HTTP/") != 0) return false;

    const std::size_t q = target.find('?');
    if (q == std::string::npos) {
        r.path = target;
        r.query.clear();
    } else {
        r.path  = target.substr(0, q);
        r.query = target.substr(q + 1);
    }
    r.method  = std::move(method);
    r.httpver = std::move(httpver);
    return true;
}

void parse_header_lines(const std::string& block, HeaderMap& out) {
    out.clear();
    std::size_t pos = 0;
    while (pos < block.size()) {
        std::size_t next = block.find("\r\n", pos);
        if (next == std::string::npos) next = block.size();
        std::string line = block.substr(pos, next - pos);
        pos = next + 2;
        std::size_t c = line.find(':');
        if (c != std::string::npos) {
            std::string k = line.substr(0, c), v = line.substr(c + 1);
            trim_inplace(k);
            trim_inplace(v);
            if (!k.empty()) out.emplace(std::move(k), std::move(v));
        }
    }
}

bool parse_request_head(const std::string& head, hg::HttpRequest& r) {
    std::size_t line_end = head.find("\r\n");
    if (line_end == std::string::npos) line_end = head.size();
    if (!parse_request_line(head.substr(0, line_end), r)) return false;
    if (line_end + 2 < head.size()) {
        parse_header_lines(head.substr(line_end + 2), r.headers);
    } else {
        r.headers.clear();
    }
    return true;
}

bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         hg::HttpResponse& out)
{
    std::size_t hdr_end = head_and_maybe_body.find("\r\n\r\n");
    if (hdr_end == std::string::npos) return false;
    hdr_end_off = hdr_end + 4;

    std::string hdrs = head_and_maybe_body.substr(0, hdr_end);
    std::size_t line_end = hdrs.find("\r\n");
    if (line_end == std::string::npos) line_end = hdrs.size();
    std::string status = hdrs.substr(0, line_end);

    // "HTTP/1.1 200 OK"
    std::istringstream iss(status);
    std::string httpver;
    if (!(iss >> httpver >> out.status_code)) return false;
    if (httpver.compare(0, 5, "HTTP/") != 0) return false;
    std::getline(iss, out.status_text);
    if (!out.status_text.empty() && out.status_text[0] == ' ') out.status_text.erase(0,1);

    if (line_end + 2 < hdrs.size()) {
        parse_header_lines(hdrs.substr(line_end + 2), out.headers);
    } else {
        out.headers.clear();
    }
    return true;
}

bool parse_content_length(const HeaderMap& H, bool& has_length, std::size_t& out) {
    has_length = false;
    out = 0;
    const std::string* v = find_header_ci(H, "Content-Length");
    if (!v) return true;
    if (v->empty()) return false;

    std::size_t n = 0;
    for (char c : *v) {
        if (c < '0' || c > '9') return false;
        const std::size_t d = static_cast<std::size_t>(c - '0');
        if (n > (std::numeric_limits<std::size_t>::max() - d) / 10) return false;
        n = n * 10 + d;
    }
    has_length = true;
    out = n;
    return true;
}

bool should_keep_alive(const std::string& httpver, const HeaderMap& H) {
    std::string conn = lower_copy(hdr_ci(H, "Connection"));
    if (httpver == "HTTP/1.1") {
        return (conn != "close");
    } else {
        return (conn == "keep-alive");
    }
}

} // namespace hg::internal
