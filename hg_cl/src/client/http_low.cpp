// SPDX-License-Identifier: Apache-2.0
// Part of the HmacGate (HG) project.
// hg_cl/src/client/http_low.cpp

#include "hg/internal/http_low.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <memory>

namespace hg::internal {

namespace {

using Clock = std::chrono::steady_clock;

struct AddrInfoFree {
    void operator()(addrinfo* p) const { if (p) freeaddrinfo(p); }
};

int ms_left(Clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

// Non-blocking connect on an already non-blocking socket. Returns 0 or an errno.
int connect_within(int s, const addrinfo* ai, Clock::time_point deadline) {
    if (::connect(s, ai->ai_addr, ai->ai_addrlen) == 0) return 0;
    if (errno != EINPROGRESS) return errno;

    pollfd pfd{s, POLLOUT, 0};
    int pr;
    do {
        pr = ::poll(&pfd, 1, ms_left(deadline));
    } while (pr < 0 && errno == EINTR);
    if (pr == 0) return ETIMEDOUT;
    if (pr < 0) return errno;

    int soerr = 0;
    socklen_t slen = sizeof(soerr);
    if (getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &slen) < 0) return errno;
    return soerr;
}

} // namespace

TcpConn::~TcpConn() { close(); }

bool TcpConn::open(const hg::ClientConfig& cfg, std::string& err) {
    close();
    _io_timeout_ms = std::max(1, cfg.io_timeout_sec) * 1000;

    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    const int rc = getaddrinfo(cfg.host.c_str(), std::to_string(cfg.port).c_str(), &hints, &raw);
    std::unique_ptr<addrinfo, AddrInfoFree> res(raw);
    if (rc != 0) {
        err = "resolve " + cfg.host + ": " + gai_strerror(rc);
        return false;
    }

    const auto deadline = Clock::now() + std::chrono::seconds(std::max(1, cfg.connect_timeout_sec));
    int last_err = ECONNREFUSED;
    for (const addrinfo* p = res.get(); p && ms_left(deadline) > 0; p = p->ai_next) {
        // stays non-blocking: all I/O below goes through poll()
        int s = ::socket(p->ai_family, p->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, p->ai_protocol);
        if (s < 0) { last_err = errno; continue; }

        last_err = connect_within(s, p, deadline);
        if (last_err != 0) { ::close(s); continue; }

        int one = 1;
        (void)setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        _fd = s;
        return true;
    }

    err = "connect " + cfg.host + ":" + std::to_string(cfg.port) + ": " + std::strerror(last_err);
    return false;
}

void TcpConn::close() {
    if (_fd >= 0) { ::close(_fd); _fd = -1; }
    _pending.clear();
}

bool TcpConn::wait_for(short events, std::string& err) {
    pollfd pfd{_fd, events, 0};
    int pr;
    do {
        pr = ::poll(&pfd, 1, _io_timeout_ms);
    } while (pr < 0 && errno == EINTR);
    if (pr == 0) { err = "i/o timeout"; return false; }
    if (pr < 0) { err = std::string("poll: ") + std::strerror(errno); return false; }
    return true;
}

bool TcpConn::write(const std::string& data, std::string& err) {
    std::size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::send(_fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n > 0) { off += static_cast<std::size_t>(n); continue; }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (!wait_for(POLLOUT, err)) return false;
            continue;
        }
        err = std::string("send: ") + std::strerror(errno);
        return false;
    }
    return true;
}

bool TcpConn::fill(std::string& err) {
    char buf[16384];
    while (true) {
        ssize_t n = ::recv(_fd, buf, sizeof(buf), 0);
        if (n > 0) { _pending.append(buf, buf + n); return true; }
        if (n == 0) { err = "connection closed by peer"; return false; }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            if (!wait_for(POLLIN, err)) return false;
            continue;
        }
        err = std::string("recv: ") + std::strerror(errno);
        return false;
    }
}

bool TcpConn::read_head(std::string& head, std::size_t max_head, std::string& err) {
    std::size_t scan_from = 0;
    while (true) {
        const std::size_t end = _pending.find("\r\n\r\n", scan_from);
        if (end != std::string::npos) {
            head.assign(_pending, 0, end + 4);
            _pending.erase(0, end + 4);
            return true;
        }
        if (_pending.size() > max_head) {
            err = "response head exceeds " + std::to_string(max_head) + " bytes";
            return false;
        }
        scan_from = _pending.size() >= 3 ? _pending.size() - 3 : 0;
        if (!fill(err)) return false;
    }
}

bool TcpConn::read_exact(std::size_t n, std::string& out, std::string& err) {
    while (_pending.size() < n) {
        if (!fill(err)) return false;
    }
    out.append(_pending, 0, n);
    _pending.erase(0, n);
    return true;
}

} // namespace hg::internal
