/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#include "hg/server.hpp"
#include "hg/log.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <thread>
#include <utility>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>

// Forward declaration of the per-connection handler provided by http_plain.cpp.
namespace hg::internal {

// Handles a single plain HTTP connection (keep-alive is managed inside).
// Does not close fd.
void handle_connection_plain(int fd,
                             const hg::ServerConfig& cfg,
                             const std::string& peer_ip,
                             const hg::HmacMiddleware& hmac,
                             const hg::Handler& handler);

} // namespace hg::internal

namespace hg {

// ---------- small socket helpers (internal) ----------

static int set_reuseaddr(int s) { int o = 1; return ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &o, sizeof(o)); }
static int set_nodelay (int s)  { int o = 1; return ::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &o, sizeof(o)); }

static std::string sockaddr_to_ip(const sockaddr_storage& ss) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        const sockaddr_in* a = reinterpret_cast<const sockaddr_in*>(&ss);
        inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf));
    } else if (ss.ss_family == AF_INET6) {
        const sockaddr_in6* a = reinterpret_cast<const sockaddr_in6*>(&ss);
        inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf));
    } else {
        std::snprintf(buf, sizeof(buf), "unknown");
    }
    return std::string(buf);
}

std::string validate(const ServerConfig& cfg) {
    if (cfg.header_name.empty()) return "header name must not be empty";
    for (char c : cfg.header_name) {
        const unsigned char u = static_cast<unsigned char>(c);
        if (u <= 0x20 || u >= 0x7f || c == ':') {
            return "header name contains an invalid character";
        }
    }
    if (cfg.secret.empty()) return "secret must not be empty";
    in_addr tmp{};
    if (::inet_pton(AF_INET, cfg.bind_addr.c_str(), &tmp) != 1) {
        return "bind address is not an IPv4 literal: " + cfg.bind_addr;
    }
    if (cfg.ka_max < 1) return "ka_max must be at least 1";
    if (cfg.ka_timeout_sec < 0) return "ka_timeout must not be negative";
    return {};
}

// ---------- Server impl ----------

Server::Server(const ServerConfig& cfg, Handler handler)
    : _cfg(cfg),
      _hmac(make_middleware(cfg.secret, cfg.header_name)),
      _handler(std::move(handler))
{
    const std::string err = validate(_cfg);
    if (!err.empty()) {
        throw std::runtime_error("ServerConfig: " + err);
    }
    if (!_handler) {
        throw std::runtime_error("Server: handler is required");
    }
}

Server::~Server() {
    stop();
    wait_for_connections();
    const int fd = _listen_fd.exchange(-1);
    if (fd >= 0) ::close(fd);
}

void Server::stop() {
    // Set stop flag; accept loop will observe it and break.
    _stop.store(true, std::memory_order_relaxed);
    const int fd = _listen_fd.load();
    if (fd >= 0) {
        // wakes a blocked accept()
        (void)::shutdown(fd, SHUT_RDWR);
    }
    std::lock_guard<std::mutex> lk(_conn_mtx);
    for (int c : _conns) {
        (void)::shutdown(c, SHUT_RDWR);
    }
}

int Server::active_connections() const {
    std::lock_guard<std::mutex> lk(_conn_mtx);
    return static_cast<int>(_conns.size());
}

void Server::wait_for_connections() {
    std::unique_lock<std::mutex> lk(_conn_mtx);
    _conn_cv.wait(lk, [this]{ return _conns.empty(); });
}

int Server::create_listen_socket() {
    int srv = ::socket(AF_INET, SOCK_STREAM, 0);
    if (srv < 0) {
        hg::log_error(std::string("[FATAL] socket() failed: ") + std::strerror(errno));
        throw std::runtime_error("socket() failed");
    }
    (void)set_reuseaddr(srv);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(_cfg.port);
    if (::inet_pton(AF_INET, _cfg.bind_addr.c_str(), &addr.sin_addr) != 1) {
        ::close(srv);
        throw std::runtime_error("bad bind address: " + _cfg.bind_addr);
    }

    if (::bind(srv, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        hg::log_error(std::string("[FATAL] bind() failed: ") + std::strerror(errno));
        ::close(srv);
        throw std::runtime_error("bind() failed");
    }
    if (::listen(srv, 512) < 0) {
        hg::log_error(std::string("[FATAL] listen() failed: ") + std::strerror(errno));
        ::close(srv);
        throw std::runtime_error("listen() failed");
    }

    sockaddr_in bound{};
    socklen_t bl = sizeof(bound);
    if (::getsockname(srv, reinterpret_cast<sockaddr*>(&bound), &bl) < 0) {
        hg::log_error(std::string("[FATAL] getsockname() failed: ") + std::strerror(errno));
        ::close(srv);
        throw std::runtime_error("getsockname() failed");
    }
    _bound_port.store(ntohs(bound.sin_port));
    return srv;
}

void Server::listen() {
    if (_listen_fd.load() >= 0) return;
    _listen_fd.store(create_listen_socket());
}

void Server::run() {
    // Basic boot log
    hg::log_info("HMAC gate server starting...");
    hg::log_info("Signature header: " + _cfg.header_name +
                 " (secret length " + std::to_string(_cfg.secret.size()) + " bytes)");
    if (_cfg.secret.size() < 32) {
        hg::log_warn("Secret is shorter than 32 bytes; consider a longer one");
    }
    hg::log_info("Status policy: missing=" + std::to_string(_cfg.status.missing_header.code) +
                 " malformed=" + std::to_string(_cfg.status.malformed_header.code) +
                 " failed=" + std::to_string(_cfg.status.authentication_failed.code) +
                 " body_read=" + std::to_string(_cfg.status.body_read_error.code));
    hg::log_info("Max body: " + std::to_string(_cfg.max_body) + " bytes");
    if (_cfg.redact_errors) {
        hg::log_info("Error redaction: ENABLED");
    }
    hg::log_info("KA timeout=" + std::to_string(_cfg.ka_timeout_sec) +
                 "s, KA max=" + std::to_string(_cfg.ka_max));

    listen();
    serve_plain();
}

void Server::serve_plain() {
    const int srv = _listen_fd.load();
    hg::log_info("Listening HTTP on " + _cfg.bind_addr + ":" + std::to_string(port()));

    while (!_stop.load(std::memory_order_relaxed)) {
        sockaddr_storage cli{};
        socklen_t cl = sizeof(cli);
        int fd = ::accept(srv, reinterpret_cast<sockaddr*>(&cli), &cl);
        if (fd < 0) {
            if (_stop.load(std::memory_order_relaxed)) break;
            if (errno == EINTR || errno == ECONNABORTED) continue;
            hg::log_warn(std::string("accept() failed: ") + std::strerror(errno));
            // EMFILE and friends: back off instead of spinning
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        (void)set_nodelay(fd);
        std::string peer = sockaddr_to_ip(cli);

        {
            std::lock_guard<std::mutex> lk(_conn_mtx);
            if (_stop.load(std::memory_order_relaxed)) {
                ::close(fd);
                break;
            }
            _conns.insert(fd);
        }

        // Detach a per-connection handler; the destructor waits for it.
        std::thread([this, fd, peer]() {
            internal::handle_connection_plain(fd, this->_cfg, peer,
                                              this->_hmac, this->_handler);
            // Notify under the lock: once it is released the Server may be gone.
            std::lock_guard<std::mutex> lk(this->_conn_mtx);
            this->_conns.erase(fd);
            ::close(fd);
            this->_conn_cv.notify_all();
        }).detach();
    }
    hg::log_info("Server stopped accepting connections");
}

} // namespace hg
