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
#include <memory>
#include "hg/client_config.hpp"
#include "hg/http_response.hpp"
#include "hg/types.hpp"

namespace hg {

// HTTP client that signs requests and checks signed responses, with keep-alive.
class Client {
public:
    explicit Client(const ClientConfig& cfg);
    ~Client();

    // Generic request:
    //  method: sent and signed verbatim, e.g. "GET"
    //  path:   e.g. "/" (signed; must not contain a query)
    //  query:  optional "a=1&b=2", appended after '?', not signed
    //  body:   raw payload
    //  extra_headers: sent as is (may not override the signature header)
    // Returns false on transport failure. out.signature tells whether the
    // response carried a valid signature; it is left NotYetChecked for HEAD,
    // whose body is never received.
    bool request(const std::string& method,
                 const std::string& path,
                 const std::string& query,
                 const std::string& body,
                 const HeaderMap& extra_headers,
                 HttpResponse& out);

    bool request(const std::string& method,
                 const std::string& path,
                 const std::string& body,
                 HttpResponse& out);

    // Header value this client would send for the given request.
    std::string signature_for(const std::string& method,
                              const std::string& path,
                              const std::string& body) const;

private:
    struct Impl;
    std::unique_ptr<Impl> _p;
};

} // namespace hg
