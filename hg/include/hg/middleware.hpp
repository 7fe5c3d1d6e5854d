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
#include "hg/authenticator.hpp"
#include "hg/signer.hpp"

namespace hg {

// The two pipeline stages, sharing one secret and one header name.
struct HmacMiddleware {
    RequestAuthenticator before;
    ResponseSigner       after;
};

HmacMiddleware make_middleware(const SecretKey& secret, const std::string& header_name);
HmacMiddleware make_middleware(const SecretKey& secret, const std::string& header_name,
                               const HmacEngine& engine);

} // namespace hg
