/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include "hg/server_config.hpp"
#include "hg/http_request.hpp"
#include "hg/http_response.hpp"
#include "hg/middleware.hpp"

namespace hg {

// Application logic. Runs only for authenticated requests; its response body
// is signed before it is sent.
using Handler = std::function<HttpResponse(const HttpRequest&)>;

// HMAC-signing HTTP server: authenticate -> handler -> sign.
class Server {
public:
    Server(const ServerConfig& cfg, Handler handler);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Create socket, bind and listen. Throws std::runtime_error on failure.
    void listen();

    // Blocking accept loop (calls listen() first if needed). Returns after stop().
    void run();

    // Unblocks accept and in-flight connections. Safe from any thread.
    void stop();

    // Bound port, valid after listen().
    uint16_t port() const { return _bound_port.load(); }

    // Open connections right now.
    int active_connections() const;

private:
    ServerConfig _cfg;
    HmacMiddleware _hmac;
    Handler _handler;

    std::atomic<bool> _stop{false};
    std::atomic<int> _listen_fd{-1};
    std::atomic<uint16_t> _bound_port{0};

    mutable std::mutex _conn_mtx;
    std::condition_variable _conn_cv;
    std::set<int> _conns;

    void serve_plain();
    void wait_for_connections();

    // helpers
    int create_listen_socket();
};

} // namespace hg
