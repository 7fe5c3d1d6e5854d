/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#include <gtest/gtest.h>
#include "hg/status_policy.hpp"

using namespace hg;

TEST(StatusPolicy, standard) {
  StatusPolicy p = StatusPolicy::standard();
  EXPECT_EQ(p.status_for(AuthError::None).code, 200);
  EXPECT_EQ(p.status_for(AuthError::MissingHeader).code, 401);
  EXPECT_EQ(p.status_for(AuthError::MalformedHeader).code, 400);
  EXPECT_EQ(p.status_for(AuthError::AuthenticationFailed).code, 401);
  EXPECT_EQ(p.status_for(AuthError::BodyReadError).code, 500);
  EXPECT_EQ(p.status_for(AuthError::MalformedHeader).text, "Bad Request");
}

TEST(StatusPolicy, forbidden) {
  StatusPolicy p = StatusPolicy::forbidden();
  EXPECT_EQ(p.status_for(AuthError::MissingHeader).code, 403);
  EXPECT_EQ(p.status_for(AuthError::MalformedHeader).code, 403);
  EXPECT_EQ(p.status_for(AuthError::AuthenticationFailed).code, 403);
  EXPECT_EQ(p.status_for(AuthError::AuthenticationFailed).text, "Forbidden");
  EXPECT_EQ(p.status_for(AuthError::BodyReadError).code, 500);
}

TEST(StatusPolicy, parse) {
  StatusPolicy p;
  ASSERT_TRUE(parse_status_policy("Forbidden", p));
  EXPECT_EQ(p.status_for(AuthError::MissingHeader).code, 403);

  ASSERT_TRUE(parse_status_policy("standard", p));
  EXPECT_EQ(p.status_for(AuthError::MissingHeader).code, 401);

  EXPECT_FALSE(parse_status_policy("teapot", p));
  EXPECT_EQ(p.status_for(AuthError::MissingHeader).code, 401);
}
