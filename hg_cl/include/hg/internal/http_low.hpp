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
#include "hg/client_config.hpp"

namespace hg::internal {

// One client-side HTTP/1.1 connection. Reads are buffered: bytes received past
// the current response head stay in the connection for the body read.
class TcpConn {
public:
    TcpConn() = default;
    ~TcpConn();

    TcpConn(const TcpConn&) = delete;
    TcpConn& operator=(const TcpConn&) = delete;

    // Connect to cfg.host:cfg.port. All resolved addresses share one
    // cfg.connect_timeout_sec budget. On failure `err` says why.
    bool open(const hg::ClientConfig& cfg, std::string& err);

    void close();
    bool is_open() const { return _fd >= 0; }

    // Each call waits at most cfg.io_timeout_sec per poll round.
    bool write(const std::string& data, std::string& err);

    // Response head including the terminating blank line.
    bool read_head(std::string& head, std::size_t max_head, std::string& err);

    // Exactly n bytes, appended to out.
    bool read_exact(std::size_t n, std::string& out, std::string& err);

private:
    int _fd = -1;
    int _io_timeout_ms = 5000;
    std::string _pending;

    bool wait_for(short events, std::string& err);
    bool fill(std::string& err);
};

} // namespace hg::internal
