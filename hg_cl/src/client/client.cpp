/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#include "hg/client.hpp"
#include "hg/log.hpp"
#include "hg/http_response.hpp"
#include "hg/authenticator.hpp"
#include "hg/signer.hpp"

#include "hg/internal/utils.hpp"
#include "hg/internal/http_parser.hpp"
#include "hg/internal/http_low.hpp"  // shared TCP helpers

#include <sstream>
#include <mutex>
#include <memory>
#include <strings.h>

namespace hg {

namespace {
constexpr std::size_t kMaxHeadBytes = 1u << 20;
}

struct Client::Impl {
    ClientConfig cfg;
    ResponseSigner verifier;

    // Keep-alive state
    std::mutex mtx;
    std::unique_ptr<internal::TcpConn> plain;
    int served_on_conn = 0;

    explicit Impl(const ClientConfig& c)
        : cfg(c), verifier(c.secret, c.header_name) {}

    ~Impl() {
        std::lock_guard<std::mutex> lk(mtx);
        close_conn_locked();
    }

    void close_conn_locked() {
        if (plain) {
            plain->close();
            plain.reset();
        }
        served_on_conn = 0;
    }

    bool ensure_conn_locked(std::string& err) {
        if (plain && plain->is_open() && served_on_conn < cfg.ka_max) return true;
        close_conn_locked();
        plain = std::make_unique<internal::TcpConn>();
        if (!plain->open(cfg, err)) { plain.reset(); return false; }
        served_on_conn = 0;
        return true;
    }

    bool recv_response_locked(bool head_only, HttpResponse& out, std::string& err) {
        std::string head;
        if (!plain->read_head(head, kMaxHeadBytes, err)) return false;

        std::size_t hdr_end_off = 0;
        if (!internal::parse_http_response(head, hdr_end_off, out)) {
            err = "unparsable response head";
            return false;
        }

        bool has_len = false;
        std::size_t content_len = 0;
        if (!internal::parse_content_length(out.headers, has_len, content_len) || !has_len) {
            err = "response without a usable Content-Length";
            return false;
        }
        if (content_len > cfg.max_body) {
            err = "response body exceeds " + std::to_string(cfg.max_body) + " bytes";
            return false;
        }

        // A HEAD response announces the length but carries no body.
        out.body.clear();
        if (!head_only && !plain->read_exact(content_len, out.body, err)) return false;

        const std::string conn = internal::lower_copy(internal::hdr_ci(out.headers, "Connection"));
        served_on_conn++;
        if (conn == "close" || served_on_conn >= cfg.ka_max) {
            close_conn_locked();
        }
        return true;
    }
};

Client::Client(const ClientConfig& cfg)
    : _p(std::make_unique<Client::Impl>(cfg)) {}

Client::~Client() = default;

std::string Client::signature_for(const std::string& method,
                                  const std::string& path,
                                  const std::string& body) const
{
    return request_signature(default_hmac_engine(), _p->cfg.secret, method, path, body);
}

bool Client::request(const std::string& method,
                     const std::string& path,
                     const std::string& query,
                     const std::string& body,
                     const HeaderMap& extra_headers,
                     HttpResponse& out)
{
    const std::string sig_hex = signature_for(method, path, body);

    std::ostringstream req;
    req << method << " " << path;
    if (!query.empty()) req << "?" << query;
    req << " HTTP/1.1\r\n";
    req << "Host: " << _p->cfg.host << ":" << _p->cfg.port << "\r\n";
    req << "User-Agent: hg-client/1\r\n";
    req << "Accept: */*\r\n";
    for (const auto& kv : extra_headers) {
        if (strcasecmp(kv.first.c_str(), _p->cfg.header_name.c_str()) == 0) continue;
        if (strcasecmp(kv.first.c_str(), "Content-Length") == 0) continue;
        req << kv.first << ": " << kv.second << "\r\n";
    }
    req << _p->cfg.header_name << ": " << sig_hex << "\r\n";
    req << "Content-Length: " << body.size() << "\r\n";
    req << "Connection: keep-alive\r\n";
    req << "\r\n";
    const std::string head = req.str();

    std::lock_guard<std::mutex> lk(_p->mtx);

    const bool head_only = (method == "HEAD");

    // A kept-alive connection may have been closed by the server in the
    // meantime; retry once on a fresh one.
    std::string err;
    for (int attempt = 0; attempt < 2; ++attempt) {
        const bool reused = (_p->plain != nullptr);
        if (!_p->ensure_conn_locked(err)) {
            hg::log_warn("[CLIENT] " + err);
            return false;
        }

        out = HttpResponse{};
        err.clear();
        const bool ok = _p->plain->write(head, err) &&
                        (body.empty() || _p->plain->write(body, err)) &&
                        _p->recv_response_locked(head_only, out, err);
        if (ok) break;

        _p->close_conn_locked();
        if (!reused || attempt == 1) {
            hg::log_warn("[CLIENT] " + method + " " + path + " failed: " + err);
            return false;
        }
    }

    // The signature covers the body a GET would carry, which HEAD never
    // receives; the verdict stays NotYetChecked.
    if (head_only) return true;

    out.signature = _p->verifier.verify(out.headers, out.body);
    if (!out.signature.allowed()) {
        hg::log_debug(std::string("[CLIENT] response signature: ") + to_string(out.signature.reason));
    }
    return true;
}

bool Client::request(const std::string& method,
                     const std::string& path,
                     const std::string& body,
                     HttpResponse& out)
{
    return request(method, path, std::string(), body, HeaderMap{}, out);
}

} // namespace hg
