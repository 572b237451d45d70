/*
 * Copyright 2016 Google Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef ASSETSPEED_KERNEL_BASE_GTEST_H_
#define ASSETSPEED_KERNEL_BASE_GTEST_H_

#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "gtest/gtest.h"

// EXPECT_HAS_SUBSTR allows a simple way to search for a substring.
// Works on StringPiece, char* and GoogleString.
#define EXPECT_HAS_SUBSTR(needle, haystack) \
  EXPECT_PRED_FORMAT2(::testing::internal::CmpHelperSUBSTR, needle, haystack)

#define EXPECT_HAS_SUBSTR_NE(needle, haystack) \
  EXPECT_PRED_FORMAT2(::testing::internal::CmpHelperSUBSTRNE, needle, haystack)

namespace testing {
namespace internal {

inline AssertionResult CmpHelperSUBSTR(const char* needle_expression,
                                       const char* haystack_expression,
                                       const StringPiece& needle,
                                       const StringPiece& haystack) {
  return ::testing::IsSubstring(needle_expression, haystack_expression,
                                needle.as_string(), haystack.as_string());
}

inline AssertionResult CmpHelperSUBSTRNE(const char* needle_expression,
                                         const char* haystack_expression,
                                         const StringPiece& needle,
                                         const StringPiece& haystack) {
  return ::testing::IsNotSubstring(needle_expression, haystack_expression,
                                   needle.as_string(), haystack.as_string());
}

}  // namespace internal
}  // namespace testing

#endif  // ASSETSPEED_KERNEL_BASE_GTEST_H_
