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
#include "hg/secret_key.hpp"
#include "hg/hmac.hpp"
#include "hg/http_response.hpp"

namespace hg {

// HMAC(secret, body)
Digest compute_response_digest(const HmacEngine& engine,
                               const SecretKey& secret,
                               const std::string& body);

// Post-handler stage: signs a fully materialised response body.
class ResponseSigner {
public:
    ResponseSigner(SecretKey secret, std::string header_name);
    ResponseSigner(SecretKey secret, std::string header_name,
                   const HmacEngine& engine);

    // Header value for `body`: 64 lowercase hex characters.
    std::string sign(const std::string& body) const;

    // Sets the signature header on `res`, replacing any existing one.
    // res.body is read, never modified.
    void apply(HttpResponse& res) const;

    // Client side: checks a received response against its signature header.
    AuthOutcome verify(const HeaderMap& headers, const std::string& body) const;

    const std::string& header_name() const { return _header; }

private:
    SecretKey _secret;
    std::string _header;
    const HmacEngine* _engine;
};

// Free-function form of ResponseSigner::sign.
std::string sign(const SecretKey& secret, const std::string& body);

} // namespace hg
