/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#include "hg/server.hpp"
#include "hg/server_config.hpp"
#include "hg/http_request.hpp"
#include "hg/http_response.hpp"
#include "hg/middleware.hpp"
#include "hg/internal/http_parser.hpp"
#include "hg/internal/utils.hpp"
#include "hg/log.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <unistd.h>
#include <strings.h>
#include <sstream>
#include <algorithm>
#include <exception>

namespace hg::internal {

namespace {

constexpr std::size_t kMaxHeadBytes = 1u << 20; // header abuse guard

// --- I/O helpers ---

bool send_all(int fd, const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(fd, d + off, len - off, MSG_NOSIGNAL);
        if (n <= 0) return false;
        off += static_cast<std::size_t>(n);
    }
    return true;
}

// Headers the server owns; a handler's copy is dropped.
bool is_framing_header(const std::string& name) {
    return strcasecmp(name.c_str(), "Content-Length") == 0 ||
           strcasecmp(name.c_str(), "Connection") == 0 ||
           strcasecmp(name.c_str(), "Keep-Alive") == 0 ||
           strcasecmp(name.c_str(), "Transfer-Encoding") == 0;
}

bool send_http_resp(int fd,
                    const hg::ServerConfig& cfg,
                    const hg::HttpResponse& res,
                    bool keep_alive,
                    bool head_only)
{
    std::ostringstream oss;
    oss << "HTTP/1.1 " << res.status_code << " " << res.status_text << "\r\n";
    if (!find_header_ci(res.headers, "Content-Type")) {
        oss << "Content-Type: text/plain; charset=utf-8\r\n";
    }
    for (const auto& kv : res.headers) {
        if (is_framing_header(kv.first)) continue;
        oss << kv.first << ": " << kv.second << "\r\n";
    }
    oss << "Content-Length: " << res.body.size() << "\r\n";
    if (keep_alive) {
        oss << "Connection: keep-alive\r\n";
        oss << "Keep-Alive: timeout=" << cfg.ka_timeout_sec
            << ", max=" << cfg.ka_max << "\r\n";
    } else {
        oss << "Connection: close\r\n";
    }
    oss << "\r\n";
    const std::string h = oss.str();
    if (!send_all(fd, h.data(), h.size())) return false;
    if (head_only) return true;
    return send_all(fd, res.body.data(), res.body.size());
}

std::string make_error_body(const hg::ServerConfig& cfg,
                            const std::string& reason)
{
    if (cfg.redact_errors) return R"({"status":"ERROR"})";
    return std::string(R"({"status":"ERROR","reason":")") + reason + R"("})";
}

hg::HttpResponse make_error_response(const hg::ServerConfig& cfg,
                                     const hg::HttpStatus& st,
                                     const std::string& reason)
{
    hg::HttpResponse res;
    res.status_code = st.code;
    res.status_text = st.text;
    res.headers.emplace("Content-Type", "application/json");
    res.body = make_error_body(cfg, reason);
    return res;
}

// Per-connection read state. Bytes past the current request stay in
// `pending` for the next one.
struct Conn {
    int fd = -1;
    std::string pending;
};

// Read up to and including the blank line. `head` excludes the CRLFCRLF.
bool recv_http_head(Conn& c, std::string& head) {
    char buf[4096];
    std::size_t scan_from = 0;
    while (true) {
        std::size_t hdr_end = c.pending.find("\r\n\r\n", scan_from);
        if (hdr_end != std::string::npos) {
            head = c.pending.substr(0, hdr_end);
            c.pending.erase(0, hdr_end + 4);
            return true;
        }
        if (c.pending.size() > kMaxHeadBytes) return false;
        scan_from = c.pending.size() >= 3 ? c.pending.size() - 3 : 0;
        ssize_t n = ::recv(c.fd, buf, sizeof(buf), 0);
        if (n <= 0) return false;
        c.pending.append(buf, buf + n);
    }
}

// Buffers exactly content_len body bytes into out.
bool recv_http_body(Conn& c, std::size_t content_len, std::string& out) {
    out.clear();
    out.reserve(content_len);
    const std::size_t take = std::min(content_len, c.pending.size());
    out.append(c.pending, 0, take);
    c.pending.erase(0, take);

    char buf[16384];
    while (out.size() < content_len) {
        const std::size_t need = content_len - out.size();
        ssize_t n = ::recv(c.fd, buf, std::min(sizeof(buf), need), 0);
        if (n <= 0) return false;
        out.append(buf, buf + n);
    }
    return true;
}

// --- Per-request pipeline ---

// Returns true when the connection may serve another request.
bool dispatch_request_plain(Conn& c,
                            const hg::ServerConfig& cfg,
                            const std::string& peer_ip,
                            hg::HttpRequest& R,
                            const hg::HmacMiddleware& hmac,
                            const hg::Handler& handler,
                            bool last_on_conn)
{
    bool ka = !last_on_conn && should_keep_alive(R.httpver, R.headers);
    const bool head_only = (R.method == "HEAD");

    // Body framing is checked inside the reader so that any failure to
    // deliver the body surfaces as BodyReadError, never as an empty body.
    std::string body_problem;
    const hg::BodyReader read_body = [&](std::string& out) -> bool {
        if (find_header_ci(R.headers, "Transfer-Encoding")) {
            body_problem = "transfer-encoding not supported";
            return false;
        }
        bool has_len = false;
        std::size_t content_len = 0;
        if (!parse_content_length(R.headers, has_len, content_len)) {
            body_problem = "bad content-length";
            return false;
        }
        if (content_len > cfg.max_body) {
            body_problem = "body exceeds " + std::to_string(cfg.max_body) + " bytes";
            return false;
        }
        if (!recv_http_body(c, content_len, out)) {
            body_problem = "connection closed mid-body";
            return false;
        }
        return true;
    };

    hg::AuthOutcome outcome;
    try {
        outcome = hmac.before.authenticate(R.headers, R.method, R.path, read_body, R.body);
    } catch (const std::exception& e) {
        hg::log_error(std::string("[500] ip=") + peer_ip + " authenticate failed: " + e.what());
        const hg::HttpStatus st{500, "Internal Server Error"};
        (void)send_http_resp(c.fd, cfg, make_error_response(cfg, st, "INTERNAL_ERROR"), false, head_only);
        return false;
    }

    if (!outcome.allowed()) {
        const hg::HttpStatus st = cfg.status.status_for(outcome.reason);
        std::string line = "[" + std::to_string(st.code) + "] ip=" + peer_ip +
                           " " + R.method + " " + R.path +
                           " reason=" + hg::to_string(outcome.reason);
        if (outcome.reason == hg::AuthError::BodyReadError) {
            line += " (" + body_problem + ")";
            // the stream position is unknown from here on
            ka = false;
        }
        hg::log_warn(line);
        (void)send_http_resp(c.fd, cfg,
                             make_error_response(cfg, st, hg::to_string(outcome.reason)),
                             ka, head_only);
        return ka;
    }

    hg::HttpResponse res;
    try {
        res = handler(R);
    } catch (const std::exception& e) {
        hg::log_error(std::string("[500] ip=") + peer_ip + " " + R.method + " " + R.path +
                      " handler failed: " + e.what());
        const hg::HttpStatus st{500, "Internal Server Error"};
        (void)send_http_resp(c.fd, cfg, make_error_response(cfg, st, "INTERNAL_ERROR"), ka, head_only);
        return ka;
    }

    // res.body is the owned buffer: signed first, then sent as is.
    try {
        hmac.after.apply(res);
    } catch (const std::exception& e) {
        hg::log_error(std::string("[500] ip=") + peer_ip + " signing failed: " + e.what());
        const hg::HttpStatus st{500, "Internal Server Error"};
        (void)send_http_resp(c.fd, cfg, make_error_response(cfg, st, "INTERNAL_ERROR"), false, head_only);
        return false;
    }

    if (!send_http_resp(c.fd, cfg, res, ka, head_only)) return false;
    hg::log_debug("[" + std::to_string(res.status_code) + "] ip=" + peer_ip +
                  " " + R.method + " " + R.path + " signed");
    return ka;
}

} // namespace

// --- Exported entry point for server.cpp ---

void handle_connection_plain(int fd,
                             const hg::ServerConfig& cfg,
                             const std::string& peer_ip,
                             const hg::HmacMiddleware& hmac,
                             const hg::Handler& handler)
{
    // Per-connection kernel timeouts
    timeval tv{cfg.ka_timeout_sec, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    Conn c;
    c.fd = fd;

    int served = 0;
    while (served < cfg.ka_max) {
        std::string head;
        if (!recv_http_head(c, head)) break;

        hg::HttpRequest R;
        if (!parse_request_head(head, R)) {
            hg::log_warn(std::string("[400] ip=") + peer_ip + " reason=BAD_REQUEST_LINE");
            const hg::HttpStatus st{400, "Bad Request"};
            (void)send_http_resp(fd, cfg, make_error_response(cfg, st, "BAD_REQUEST"), false, false);
            break;
        }

        const bool last = (served + 1 >= cfg.ka_max);
        bool ka_next = dispatch_request_plain(c, cfg, peer_ip, R, hmac, handler, last);
        ++served;
        if (!ka_next) break;
    }
}

} // namespace hg::internal
