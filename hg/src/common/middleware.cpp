/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#include "hg/middleware.hpp"

namespace hg {

HmacMiddleware make_middleware(const SecretKey& secret, const std::string& header_name) {
    return make_middleware(secret, header_name, default_hmac_engine());
}

HmacMiddleware make_middleware(const SecretKey& secret, const std::string& header_name,
                               const HmacEngine& engine)
{
    return HmacMiddleware{
        RequestAuthenticator(secret, header_name, engine),
        ResponseSigner(secret, header_name, engine)
    };
}

} // namespace hg
