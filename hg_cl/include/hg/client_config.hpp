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

namespace hg {

// Public client configuration. Per-instance; thread-safe at call level.
struct ClientConfig {
    // Endpoint
    std::string host = "127.0.0.1";
    std::uint16_t port = 8080;

    // Signing
    std::string header_name = "x-hmac";
    SecretKey   secret;

    // Timeouts
    int connect_timeout_sec = 5;   // TCP connect timeout
    int io_timeout_sec      = 5;   // recv/send timeout
    int ka_max              = 100; // max requests per connection before re-open

    // Responses larger than this are treated as a transport failure.
    std::size_t max_body = 64*1024*1024;
};

} // namespace hg
