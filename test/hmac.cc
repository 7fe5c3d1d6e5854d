/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#include <gtest/gtest.h>
#include "hg/hmac.hpp"
#include "hg/secret_key.hpp"
#include "hg/internal/utils.hpp"

using namespace hg;

namespace {

std::string hex(const Digest& d) {
  return internal::digest_to_hex(d);
}

}

// RFC 4231, test case 2
TEST(Hmac, rfc4231_case_2) {
  SecretKey key = SecretKey::from_string("Jefe");
  Digest d = default_hmac_engine().compute(key, "what do ya want for nothing?");
  EXPECT_EQ(hex(d), "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

// RFC 4231, test case 1
TEST(Hmac, rfc4231_case_1) {
  SecretKey key = SecretKey::from_bytes(std::string(20, '\x0b').data(), 20);
  Digest d = default_hmac_engine().compute(key, "Hi There");
  EXPECT_EQ(hex(d), "b0344c61d8db38535ca8afceaf0bf12b881dc200c9833da726e9376c2e32cff7");
}

TEST(Hmac, empty_key_and_empty_message) {
  SecretKey key;
  ASSERT_TRUE(key.empty());
  Digest d = default_hmac_engine().compute(key, std::string());
  EXPECT_EQ(hex(d), "b613679a0814d9ec772f95d778c35fc5ff1697c493715653c6c712144292c5ad");
}

TEST(Hmac, incremental_matches_one_shot) {
  SecretKey key = SecretKey::from_string("rust :)");
  const std::string msg = "the quick brown fox jumps over the lazy dog";

  auto stream = default_hmac_engine().start(key);
  stream->update(msg.substr(0, 10));
  stream->update(std::string());
  stream->update(msg.substr(10));
  EXPECT_EQ(stream->finish(), default_hmac_engine().compute(key, msg));
}

TEST(Hmac, different_keys_differ) {
  SecretKey a = SecretKey::from_string("key-a");
  SecretKey b = SecretKey::from_string("key-b");
  EXPECT_NE(default_hmac_engine().compute(a, "payload"),
            default_hmac_engine().compute(b, "payload"));
}

TEST(Hmac, separate_engine_instances_agree) {
  OpensslHmacEngine engine;
  SecretKey key = SecretKey::from_string("Jefe");
  EXPECT_EQ(engine.compute(key, "what do ya want for nothing?"),
            default_hmac_engine().compute(key, "what do ya want for nothing?"));
}
