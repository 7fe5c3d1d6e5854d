/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#include <gtest/gtest.h>
#include "hg/internal/http_parser.hpp"
#include "hg/internal/utils.hpp"

using namespace hg;
using namespace hg::internal;

TEST(HttpParser, request_line) {
  HttpRequest r;
  ASSERT_TRUE(parse_request_line("POST /echo?a=1&b=2 HTTP/1.1", r));
  EXPECT_EQ(r.method, "POST");
  EXPECT_EQ(r.path, "/echo");
  EXPECT_EQ(r.query, "a=1&b=2");
  EXPECT_EQ(r.httpver, "HTTP/1.1");

  ASSERT_TRUE(parse_request_line("GET / HTTP/1.0", r));
  EXPECT_EQ(r.path, "/");
  EXPECT_EQ(r.query, "");
}

TEST(HttpParser, bad_request_lines) {
  HttpRequest r;
  EXPECT_FALSE(parse_request_line("", r));
  EXPECT_FALSE(parse_request_line("GET /", r));
  EXPECT_FALSE(parse_request_line("GET  / HTTP/1.1", r));
  EXPECT_FALSE(parse_request_line("GET / HTTP/1.1 extra", r));
  EXPECT_FALSE(parse_request_line("GET http://host/ HTTP/1.1", r));
  EXPECT_FALSE(parse_request_line("GET / FTP/1.0", r));
}

TEST(HttpParser, request_head) {
  HttpRequest r;
  ASSERT_TRUE(parse_request_head(
    "GET /x HTTP/1.1\r\nHost: localhost\r\nX-Hmac:  abc \r\nbroken line\r\nX-Hmac: second", r));
  EXPECT_EQ(r.path, "/x");
  EXPECT_EQ(r.headers.size(), 3u);
  EXPECT_EQ(hdr_ci(r.headers, "host"), "localhost");
  EXPECT_EQ(hdr_ci(r.headers, "x-hmac"), "abc");
}

TEST(HttpParser, response_head) {
  HttpResponse res;
  std::size_t off = 0;
  const std::string raw = "HTTP/1.1 401 Unauthorized\r\nContent-Length: 5\r\nx-hmac: ff\r\n\r\nhello";
  ASSERT_TRUE(parse_http_response(raw, off, res));
  EXPECT_EQ(res.status_code, 401);
  EXPECT_EQ(res.status_text, "Unauthorized");
  EXPECT_EQ(raw.substr(off), "hello");
  EXPECT_EQ(hdr_ci(res.headers, "X-HMAC"), "ff");

  EXPECT_FALSE(parse_http_response("HTTP/1.1 200 OK\r\n", off, res));
  EXPECT_FALSE(parse_http_response("garbage\r\n\r\n", off, res));
}

TEST(HttpParser, content_length) {
  HeaderMap h;
  bool has = true;
  std::size_t n = 99;
  ASSERT_TRUE(parse_content_length(h, has, n));
  EXPECT_FALSE(has);
  EXPECT_EQ(n, 0u);

  h.emplace("content-length", "42");
  ASSERT_TRUE(parse_content_length(h, has, n));
  EXPECT_TRUE(has);
  EXPECT_EQ(n, 42u);

  HeaderMap neg;
  neg.emplace("Content-Length", "-1");
  EXPECT_FALSE(parse_content_length(neg, has, n));

  HeaderMap huge;
  huge.emplace("Content-Length", "99999999999999999999999999");
  EXPECT_FALSE(parse_content_length(huge, has, n));
}

TEST(HttpParser, keep_alive) {
  HeaderMap none;
  EXPECT_TRUE(should_keep_alive("HTTP/1.1", none));
  EXPECT_FALSE(should_keep_alive("HTTP/1.0", none));

  HeaderMap close;
  close.emplace("Connection", "Close");
  EXPECT_FALSE(should_keep_alive("HTTP/1.1", close));

  HeaderMap ka;
  ka.emplace("connection", "keep-alive");
  EXPECT_TRUE(should_keep_alive("HTTP/1.0", ka));
}
