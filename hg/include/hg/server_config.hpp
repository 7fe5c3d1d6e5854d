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
#include <cstddef>
#include <cstdint>
#include "hg/secret_key.hpp"
#include "hg/status_policy.hpp"

namespace hg {

struct ServerConfig {
    // Listener
    std::string bind_addr = "0.0.0.0";  // IPv4 literal
    uint16_t    port = 8080;            // 0 = ephemeral, see Server::port()

    // Signing
    std::string  header_name = "x-hmac";
    SecretKey    secret;
    StatusPolicy status = StatusPolicy::standard();

    // Requests with a larger body are rejected as BodyReadError.
    std::size_t max_body = 10*1024*1024;

    // Error redaction: drop the reason from JSON error bodies
    bool redact_errors = false;

    // Keep-alive
    int ka_timeout_sec = 5;
    int ka_max         = 100;
};

// Empty string when cfg is usable, otherwise what is wrong with it.
std::string validate(const ServerConfig& cfg);

} // namespace hg
