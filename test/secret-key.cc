/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#include <gtest/gtest.h>
#include "hg/secret_key.hpp"

#include <cstdio>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unistd.h>

using namespace hg;

namespace {

std::string key_str(const SecretKey& key) {
  return std::string(reinterpret_cast<const char*>(key.data()), key.size());
}

std::string write_temp_file(const std::string& contents) {
  char path[] = "/tmp/hg-secret-XXXXXX";
  int fd = mkstemp(path);
  EXPECT_GE(fd, 0);
  if(fd >= 0) close(fd);

  std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
  out << contents;
  return path;
}

}

TEST(SecretKey, default_is_empty) {
  SecretKey key;
  EXPECT_TRUE(key.empty());
  EXPECT_EQ(key.size(), 0u);
}

TEST(SecretKey, from_string_and_bytes) {
  SecretKey key = SecretKey::from_string("rust :)");
  EXPECT_EQ(key.size(), 7u);
  EXPECT_EQ(key_str(key), "rust :)");

  const char raw[] = { 'a', '\0', 'b' };
  SecretKey bin = SecretKey::from_bytes(raw, sizeof(raw));
  EXPECT_EQ(bin.size(), 3u);
  EXPECT_EQ(key_str(bin), std::string(raw, 3));

  EXPECT_TRUE(SecretKey::from_bytes(nullptr, 5).empty());
}

TEST(SecretKey, copies_share_contents) {
  SecretKey a = SecretKey::from_string("shared");
  SecretKey b = a;
  EXPECT_EQ(a.data(), b.data());
  EXPECT_EQ(key_str(b), "shared");
}

TEST(SecretKey, copy_outlives_original) {
  std::unique_ptr<SecretKey> original(new SecretKey(SecretKey::from_string("short lived")));
  SecretKey copy = *original;
  SecretKey assigned;
  assigned = *original;
  original.reset();

  EXPECT_EQ(key_str(copy), "short lived");
  EXPECT_EQ(key_str(assigned), "short lived");
  EXPECT_EQ(copy.data(), assigned.data());
}

TEST(SecretKey, from_hex) {
  SecretKey key;
  ASSERT_TRUE(SecretKey::from_hex("4a656665", key));
  EXPECT_EQ(key_str(key), "Jefe");

  SecretKey untouched = SecretKey::from_string("keep");
  EXPECT_FALSE(SecretKey::from_hex("4a6", untouched));
  EXPECT_FALSE(SecretKey::from_hex("zz", untouched));
  EXPECT_EQ(key_str(untouched), "keep");
}

TEST(SecretKey, from_file_trims_trailing_whitespace) {
  std::string path = write_temp_file("rust :)\r\n\n");
  SecretKey key = SecretKey::from_file(path);
  EXPECT_EQ(key_str(key), "rust :)");
  std::remove(path.c_str());
}

TEST(SecretKey, from_file_keeps_leading_whitespace) {
  std::string path = write_temp_file("  padded");
  SecretKey key = SecretKey::from_file(path);
  EXPECT_EQ(key_str(key), "  padded");
  std::remove(path.c_str());
}

TEST(SecretKey, from_file_missing_throws) {
  ASSERT_THROW(SecretKey::from_file("/nonexistent/hg/secret"), std::runtime_error);
}
