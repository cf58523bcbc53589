// unique/result_testing.h - Macros for checking unique::Result values in tests
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef UNIQUE_RESULT_TESTING_H
#define UNIQUE_RESULT_TESTING_H

#include "gtest/gtest.h"
#include "unique/result.h"

namespace unique {
namespace testing {

inline ::testing::AssertionResult ResultCodeEQ(const char* code_text,
                                               const char* expr_text,
                                               Result::Code code,
                                               const Result& expr) {
  if (code == expr.code()) return ::testing::AssertionSuccess();
  return ::testing::AssertionFailure()
         << "expression: " << expr_text << "\n"
         << "  expected: " << code << "(" << static_cast<unsigned int>(code)
         << ")\n"
         << "       got: " << expr.as_string();
}

}  // namespace testing
}  // namespace unique

#define UNIQUE_RESULT_CODE(name) ::unique::Result::Code::name

#define ASSERT_OK(x)                                                   \
  ASSERT_PRED_FORMAT2(::unique::testing::ResultCodeEQ,                 \
                      UNIQUE_RESULT_CODE(OK), x)
#define ASSERT_INVALID_ARGUMENT(x)                                     \
  ASSERT_PRED_FORMAT2(::unique::testing::ResultCodeEQ,                 \
                      UNIQUE_RESULT_CODE(INVALID_ARGUMENT), x)
#define ASSERT_RESOURCE_EXHAUSTED(x)                                   \
  ASSERT_PRED_FORMAT2(::unique::testing::ResultCodeEQ,                 \
                      UNIQUE_RESULT_CODE(RESOURCE_EXHAUSTED), x)

#define EXPECT_OK(x)                                                   \
  EXPECT_PRED_FORMAT2(::unique::testing::ResultCodeEQ,                 \
                      UNIQUE_RESULT_CODE(OK), x)
#define EXPECT_INVALID_ARGUMENT(x)                                     \
  EXPECT_PRED_FORMAT2(::unique::testing::ResultCodeEQ,                 \
                      UNIQUE_RESULT_CODE(INVALID_ARGUMENT), x)
#define EXPECT_RESOURCE_EXHAUSTED(x)                                   \
  EXPECT_PRED_FORMAT2(::unique::testing::ResultCodeEQ,                 \
                      UNIQUE_RESULT_CODE(RESOURCE_EXHAUSTED), x)

#endif  // UNIQUE_RESULT_TESTING_H
