/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>

#include "common/outcome.hpp"

/**
 * Expects result to hold a value, `val` is bound to it:
 * EXPECT_OUTCOME_TRUE(val, expr);
 */
#define EXPECT_OUTCOME_TRUE(val, expr)                                   \
  auto &&_##val##_result = (expr);                                       \
  ASSERT_TRUE(_##val##_result)                                           \
      << "Line " << __LINE__ << ": " << _##val##_result.error().message(); \
  auto &&val = _##val##_result.value();

/// Expects result to hold a value or success
#define EXPECT_OUTCOME_TRUE_1(expr)                                      \
  {                                                                      \
    auto &&_result = (expr);                                             \
    EXPECT_TRUE(_result)                                                 \
        << "Line " << __LINE__ << ": " << _result.error().message();     \
  }

/// Expects result to hold value equal to `value`
#define EXPECT_OUTCOME_EQ(expr, value)                                   \
  {                                                                      \
    auto &&_result = (expr);                                             \
    ASSERT_TRUE(_result)                                                 \
        << "Line " << __LINE__ << ": " << _result.error().message();     \
    EXPECT_EQ(_result.value(), (value));                                 \
  }

/// Expects result to hold error `ecode`
#define EXPECT_OUTCOME_ERROR(ecode, expr)                                \
  {                                                                      \
    auto &&_result = (expr);                                             \
    ASSERT_FALSE(_result) << "Line " << __LINE__ << ": value expected "  \
                                                     "to be error";      \
    EXPECT_EQ(_result.error(), make_error_code(ecode));                  \
  }
