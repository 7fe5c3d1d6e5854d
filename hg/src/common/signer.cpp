/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#include "hg/signer.hpp"
#include "hg/authenticator.hpp"
#include "hg/internal/utils.hpp"
#include <utility>

namespace hg {

Digest compute_response_digest(const HmacEngine& engine,
                               const SecretKey& secret,
                               const std::string& body)
{
    return engine.compute(secret, body);
}

ResponseSigner::ResponseSigner(SecretKey secret, std::string header_name)
    : ResponseSigner(std::move(secret), std::move(header_name), default_hmac_engine())
{}

ResponseSigner::ResponseSigner(SecretKey secret, std::string header_name,
                               const HmacEngine& engine)
    : _secret(std::move(secret)),
      _header(std::move(header_name)),
      _engine(&engine)
{}

std::string ResponseSigner::sign(const std::string& body) const {
    return internal::digest_to_hex(compute_response_digest(*_engine, _secret, body));
}

void ResponseSigner::apply(HttpResponse& res) const {
    internal::set_header_ci(res.headers, _header, sign(res.body));
}

AuthOutcome ResponseSigner::verify(const HeaderMap& headers, const std::string& body) const {
    const Digest expected = compute_response_digest(*_engine, _secret, body);
    return check_signature_header(headers, _header, expected);
}

std::string sign(const SecretKey& secret, const std::string& body) {
    return internal::digest_to_hex(compute_response_digest(default_hmac_engine(), secret, body));
}

} // namespace hg
