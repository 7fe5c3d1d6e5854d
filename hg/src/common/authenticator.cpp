/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#include "hg/authenticator.hpp"
#include "hg/internal/utils.hpp"
#include <algorithm>
#include <utility>

namespace hg {

Digest compute_request_digest(const HmacEngine& engine,
                              const SecretKey& secret,
                              const std::string& method,
                              const std::string& path,
                              const std::string& body)
{
    const Digest d_method = engine.compute(secret, method);
    const Digest d_path   = engine.compute(secret, path);
    const Digest d_body   = engine.compute(secret, body);

    // Order is part of the wire contract: method, path, body.
    auto merged = engine.start(secret);
    merged->update(d_method);
    merged->update(d_path);
    merged->update(d_body);
    return merged->finish();
}

std::string request_signature(const HmacEngine& engine,
                              const SecretKey& secret,
                              const std::string& method,
                              const std::string& path,
                              const std::string& body)
{
    return internal::digest_to_hex(
        compute_request_digest(engine, secret, method, path, body));
}

bool parse_signature(const std::string& value, Digest& out) {
    if (value.size() != kSignatureHexLen) return false;
    // uppercase would decode fine, but the wire format is lowercase only
    if (!internal::is_lower_hex(value)) return false;

    std::string bin;
    if (!internal::hex_to_bytes(value, bin) || bin.size() != kDigestSize) {
        return false;
    }
    std::copy(bin.begin(), bin.end(), out.begin());
    return true;
}

AuthOutcome check_signature_header(const HeaderMap& headers,
                                   const std::string& header_name,
                                   const Digest& expected)
{
    const std::string* supplied_hex = internal::find_header_ci(headers, header_name);
    if (!supplied_hex) {
        return AuthOutcome::reject(AuthError::MissingHeader,
                                   "missing signature header (key = " + header_name + ")");
    }

    Digest supplied{};
    if (!parse_signature(*supplied_hex, supplied)) {
        return AuthOutcome::reject(AuthError::MalformedHeader,
                                   "signature header is not " +
                                   std::to_string(kSignatureHexLen) + " lowercase hex chars");
    }

    if (!internal::ct_equal(expected.data(), expected.size(),
                            supplied.data(), supplied.size())) {
        return AuthOutcome::reject(AuthError::AuthenticationFailed,
                                   "provided signature is invalid");
    }
    return AuthOutcome::allow();
}

RequestAuthenticator::RequestAuthenticator(SecretKey secret, std::string header_name)
    : RequestAuthenticator(std::move(secret), std::move(header_name), default_hmac_engine())
{}

RequestAuthenticator::RequestAuthenticator(SecretKey secret, std::string header_name,
                                           const HmacEngine& engine)
    : _secret(std::move(secret)),
      _header(std::move(header_name)),
      _engine(&engine)
{}

AuthOutcome RequestAuthenticator::authenticate(const HeaderMap& headers,
                                               const std::string& method,
                                               const std::string& path,
                                               const std::string& body) const
{
    const Digest expected = compute_request_digest(*_engine, _secret, method, path, body);
    return check_signature_header(headers, _header, expected);
}

AuthOutcome RequestAuthenticator::authenticate(const HeaderMap& headers,
                                               const std::string& method,
                                               const std::string& path,
                                               const BodyReader& read_body,
                                               std::string& body_out) const
{
    body_out.clear();
    if (read_body && !read_body(body_out)) {
        body_out.clear();
        return AuthOutcome::reject(AuthError::BodyReadError,
                                   "failed to read request body");
    }
    return authenticate(headers, method, path, body_out);
}

AuthOutcome authenticate(const SecretKey& secret,
                         const std::string& header_name,
                         const HeaderMap& headers,
                         const std::string& method,
                         const std::string& path,
                         const std::string& body)
{
    return RequestAuthenticator(secret, header_name).authenticate(headers, method, path, body);
}

} // namespace hg
