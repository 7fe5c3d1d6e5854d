/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#pragma once
#include <functional>
#include <string>
#include "hg/types.hpp"
#include "hg/secret_key.hpp"
#include "hg/hmac.hpp"

namespace hg {

// Hex-encoded digests are exactly this long on the wire.
constexpr std::size_t kSignatureHexLen = 2 * kDigestSize;

// Reads the complete request body into `out`. Returns false when the
// transport could not deliver it.
using BodyReader = std::function<bool(std::string& out)>;

// HMAC(secret, HMAC(secret, method) || HMAC(secret, path) || HMAC(secret, body))
Digest compute_request_digest(const HmacEngine& engine,
                              const SecretKey& secret,
                              const std::string& method,
                              const std::string& path,
                              const std::string& body);

// Lowercase hex of compute_request_digest, as a client puts it on the wire.
std::string request_signature(const HmacEngine& engine,
                              const SecretKey& secret,
                              const std::string& method,
                              const std::string& path,
                              const std::string& body);

// Parse a supplied signature header value. Only 64 lowercase hex characters
// are accepted.
bool parse_signature(const std::string& value, Digest& out);

// Checks the signature header of `headers` against `expected`.
AuthOutcome check_signature_header(const HeaderMap& headers,
                                   const std::string& header_name,
                                   const Digest& expected);

/**
 * Pre-handler stage: accepts or rejects an inbound request.
 *
 * Holds only immutable state; one instance may serve any number of
 * concurrent requests.
 */
class RequestAuthenticator {
public:
    RequestAuthenticator(SecretKey secret, std::string header_name);
    RequestAuthenticator(SecretKey secret, std::string header_name,
                         const HmacEngine& engine);

    // Body already materialised by the host.
    AuthOutcome authenticate(const HeaderMap& headers,
                             const std::string& method,
                             const std::string& path,
                             const std::string& body) const;

    // Body pulled through `read_body` into `body_out`, which the host then
    // hands to the application handler. A read failure is BodyReadError and
    // never treated as an empty body. An empty `read_body` means no body.
    AuthOutcome authenticate(const HeaderMap& headers,
                             const std::string& method,
                             const std::string& path,
                             const BodyReader& read_body,
                             std::string& body_out) const;

    const std::string& header_name() const { return _header; }

private:
    SecretKey _secret;
    std::string _header;
    const HmacEngine* _engine;
};

// Free-function form of RequestAuthenticator::authenticate.
AuthOutcome authenticate(const SecretKey& secret,
                         const std::string& header_name,
                         const HeaderMap& headers,
                         const std::string& method,
                         const std::string& path,
                         const std::string& body);

} // namespace hg
