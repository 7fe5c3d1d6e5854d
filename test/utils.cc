/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#include <gtest/gtest.h>
#include "hg/internal/utils.hpp"
#include "hg/types.hpp"

#include <random>

using namespace hg;
using namespace hg::internal;

TEST(Hex, encode_is_lowercase) {
  const unsigned char raw[] = { 0x00, 0x0f, 0xab, 0xff, 0x10 };
  EXPECT_EQ(bytes_to_hex(raw, sizeof(raw)), "000fabff10");
  EXPECT_EQ(bytes_to_hex(std::string()), "");
  EXPECT_EQ(bytes_to_hex(std::string("\x01\xfe", 2)), "01fe");
}

TEST(Hex, decode_accepts_either_case) {
  std::string out;
  ASSERT_TRUE(hex_to_bytes("01FEab", out));
  EXPECT_EQ(out, std::string("\x01\xfe\xab", 3));

  ASSERT_TRUE(hex_to_bytes("", out));
  EXPECT_TRUE(out.empty());
}

TEST(Hex, decode_rejects_bad_input) {
  std::string out = "untouched";
  EXPECT_FALSE(hex_to_bytes("abc", out));
  EXPECT_FALSE(hex_to_bytes("zz", out));
  EXPECT_FALSE(hex_to_bytes("0g", out));
  EXPECT_FALSE(hex_to_bytes("12 4", out));
  EXPECT_EQ(out, "untouched");
}

TEST(Hex, round_trip_all_bytes) {
  std::string all;
  for(int i = 0; i < 256; i++) all.push_back((char) i);

  std::string out;
  ASSERT_TRUE(hex_to_bytes(bytes_to_hex(all), out));
  EXPECT_EQ(out, all);

  out = "stale";
  ASSERT_TRUE(hex_to_bytes(bytes_to_hex(std::string()), out));
  EXPECT_TRUE(out.empty());

  std::mt19937 gen(1234);
  std::uniform_int_distribution<int> len(1, 300);
  std::uniform_int_distribution<int> byte(0, 255);
  for(int round = 0; round < 50; round++) {
    std::string buf(len(gen), '\0');
    for(char& c : buf) c = (char) byte(gen);

    const std::string hex = bytes_to_hex(buf);
    ASSERT_EQ(hex.size(), buf.size() * 2);
    ASSERT_TRUE(is_lower_hex(hex));
    ASSERT_TRUE(hex_to_bytes(hex, out));
    ASSERT_EQ(out, buf);
  }
}

TEST(Hex, digest_to_hex) {
  Digest d{};
  d[0] = 0xde; d[31] = 0x01;
  std::string hex = digest_to_hex(d);
  ASSERT_EQ(hex.size(), 64u);
  EXPECT_EQ(hex.substr(0, 2), "de");
  EXPECT_EQ(hex.substr(62, 2), "01");
  EXPECT_EQ(hex.substr(2, 60), std::string(60, '0'));
}

TEST(Hex, is_lower_hex) {
  EXPECT_TRUE(is_lower_hex("0123456789abcdef"));
  EXPECT_FALSE(is_lower_hex("0123456789ABCDEF"));
  EXPECT_FALSE(is_lower_hex("xyz"));
  EXPECT_FALSE(is_lower_hex(""));
}

TEST(ConstantTime, equal_and_unequal) {
  EXPECT_TRUE(ct_equal(std::string("abc"), std::string("abc")));
  EXPECT_FALSE(ct_equal(std::string("abc"), std::string("abd")));
  EXPECT_FALSE(ct_equal(std::string("abc"), std::string("abcd")));
  EXPECT_FALSE(ct_equal(std::string(""), std::string("a")));
  EXPECT_TRUE(ct_equal(std::string(""), std::string("")));

  const std::string a(32, '\x00');
  std::string b(32, '\x00');
  b[31] = '\x01';
  EXPECT_FALSE(ct_equal(a, b));
  b[31] = '\x00';
  EXPECT_TRUE(ct_equal(a, b));
}

TEST(Utils, trim_and_lower) {
  std::string s = "  \tvalue \r\n";
  trim_inplace(s);
  EXPECT_EQ(s, "value");

  std::string blank = "   ";
  trim_inplace(blank);
  EXPECT_EQ(blank, "");

  EXPECT_EQ(lower_copy("X-HMAC"), "x-hmac");
}

TEST(Utils, header_lookup_is_case_insensitive) {
  HeaderMap h;
  h.emplace("X-Hmac", "first");
  h.emplace("Content-Type", "text/plain");

  const std::string* v = find_header_ci(h, "x-hmac");
  ASSERT_NE(v, nullptr);
  EXPECT_EQ(*v, "first");
  EXPECT_EQ(hdr_ci(h, "CONTENT-TYPE"), "text/plain");
  EXPECT_EQ(find_header_ci(h, "x-other"), nullptr);
  EXPECT_EQ(hdr_ci(h, "x-other"), "");
}

TEST(Utils, header_lookup_keeps_map_order_across_case) {
  HeaderMap h;
  h.emplace("x-hmac", "second");
  h.emplace("X-HMAC", "first");

  // "X-HMAC" sorts first, so it wins even though the exact-case name exists.
  const std::string* v = find_header_ci(h, "x-hmac");
  ASSERT_NE(v, nullptr);
  EXPECT_EQ(*v, "first");
  EXPECT_EQ(hdr_ci(h, "X-Hmac"), "first");
}

TEST(Utils, parse_port) {
  uint16_t port = 1;
  ASSERT_TRUE(parse_port("8080", false, port));
  EXPECT_EQ(port, 8080);
  ASSERT_TRUE(parse_port("65535", false, port));
  EXPECT_EQ(port, 65535);
  ASSERT_TRUE(parse_port("1", false, port));
  EXPECT_EQ(port, 1);

  port = 1234;
  EXPECT_FALSE(parse_port("0", false, port));
  EXPECT_EQ(port, 1234);
  ASSERT_TRUE(parse_port("0", true, port));
  EXPECT_EQ(port, 0);

  port = 1234;
  EXPECT_FALSE(parse_port("70000", true, port));
  EXPECT_FALSE(parse_port("65536", true, port));
  EXPECT_FALSE(parse_port("123456", true, port));
  EXPECT_FALSE(parse_port("-1", true, port));
  EXPECT_FALSE(parse_port("", true, port));
  EXPECT_FALSE(parse_port(" 80", true, port));
  EXPECT_FALSE(parse_port("80a", true, port));
  EXPECT_FALSE(parse_port("+80", true, port));
  EXPECT_EQ(port, 1234);
}

TEST(Utils, set_header_replaces_every_variant) {
  HeaderMap h;
  h.emplace("X-HMAC", "old1");
  h.emplace("x-hmac", "old2");
  h.emplace("Other", "keep");

  set_header_ci(h, "x-hmac", "new");
  EXPECT_EQ(h.size(), 2u);
  EXPECT_EQ(h.count("X-HMAC"), 0u);
  EXPECT_EQ(hdr_ci(h, "x-hmac"), "new");
  EXPECT_EQ(hdr_ci(h, "other"), "keep");
}

TEST(Utils, secure_wipe) {
  std::string s = "very secret";
  secure_wipe(s);
  EXPECT_TRUE(s.empty());
}

TEST(Types, reason_codes) {
  EXPECT_STREQ(to_string(AuthError::None), "NONE");
  EXPECT_STREQ(to_string(AuthError::MissingHeader), "MISSING_HEADER");
  EXPECT_STREQ(to_string(AuthError::MalformedHeader), "MALFORMED_HEADER");
  EXPECT_STREQ(to_string(AuthError::AuthenticationFailed), "AUTHENTICATION_FAILED");
  EXPECT_STREQ(to_string(AuthError::BodyReadError), "BODY_READ_ERROR");
}

TEST(Types, default_outcome_is_not_allowed) {
  AuthOutcome outcome;
  EXPECT_EQ(outcome.state, AuthState::NotYetChecked);
  EXPECT_FALSE(outcome.allowed());
  EXPECT_FALSE(outcome.rejected());

  AuthOutcome ok = AuthOutcome::allow();
  EXPECT_TRUE(ok.allowed());
  EXPECT_EQ(ok.reason, AuthError::None);

  AuthOutcome bad = AuthOutcome::reject(AuthError::MalformedHeader, "nope");
  EXPECT_TRUE(bad.rejected());
  EXPECT_FALSE(bad.allowed());
  EXPECT_EQ(bad.reason, AuthError::MalformedHeader);
  EXPECT_EQ(bad.detail, "nope");
}
