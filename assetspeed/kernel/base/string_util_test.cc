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


#include "assetspeed/kernel/base/string_util.h"

#include "assetspeed/kernel/base/gtest.h"
#include "assetspeed/kernel/base/string.h"

namespace assetspeed {

namespace {

TEST(StringUtilTest, TestStrCat) {
  EXPECT_EQ("ab", StrCat("a", "b"));
  EXPECT_EQ("abcdef", StrCat("a", "b", "c", "d", "e", "f"));
  GoogleString s("x");
  StrAppend(&s, "y", "z");
  EXPECT_EQ("xyz", s);
}

TEST(StringUtilTest, TestNumbers) {
  EXPECT_EQ("-12", IntegerToString(-12));
  EXPECT_EQ("10000000000", Integer64ToString(10000000000LL));
  int64 value;
  EXPECT_TRUE(StringToInt64("8192", &value));
  EXPECT_EQ(8192, value);
  EXPECT_FALSE(StringToInt64("8k", &value));
  double d;
  EXPECT_TRUE(StringToDouble(" 0.25 ", &d));
  EXPECT_DOUBLE_EQ(0.25, d);
  EXPECT_FALSE(StringToDouble("half", &d));
  EXPECT_FALSE(StringToDouble("", &d));
}

TEST(StringUtilTest, TestSplit) {
  StringPieceVector components;
  SplitStringPieceToVector("a,b,,c", ",", &components, true);
  ASSERT_EQ(3, components.size());
  EXPECT_EQ("a", components[0]);
  EXPECT_EQ("c", components[2]);

  components.clear();
  SplitStringPieceToVector("a,b,,c", ",", &components, false);
  ASSERT_EQ(4, components.size());
  EXPECT_EQ("", components[2]);
}

TEST(StringUtilTest, TestGlobalReplaceSubstring) {
  GoogleString s("/uploads/{filename}/{filename}");
  EXPECT_EQ(2, GlobalReplaceSubstring("{filename}", "a.png", &s));
  EXPECT_EQ("/uploads/a.png/a.png", s);
  EXPECT_EQ(0, GlobalReplaceSubstring("{x}", "y", &s));
  EXPECT_EQ("/uploads/a.png/a.png", s);
}

TEST(StringUtilTest, TestTrimWhitespace) {
  StringPiece piece(" \t a b \n");
  EXPECT_TRUE(TrimWhitespace(&piece));
  EXPECT_EQ("a b", piece);
  EXPECT_FALSE(TrimWhitespace(&piece));
  GoogleString out;
  TrimWhitespace("  x  ", &out);
  EXPECT_EQ("x", out);
}

TEST(StringUtilTest, TestCaseCompare) {
  EXPECT_TRUE(StringCaseEqual("Data:", "dATA:"));
  EXPECT_FALSE(StringCaseEqual("data", "data:"));
  EXPECT_TRUE(StringCaseStartsWith("DATA:image/png", "data:"));
  EXPECT_FALSE(StringCaseStartsWith("da", "data:"));
  EXPECT_TRUE(StringCaseEndsWith("A.PNG", ".png"));
  GoogleString lower("MiXeD");
  LowerString(&lower);
  EXPECT_EQ("mixed", lower);
}

TEST(StringUtilTest, TestFormatBytes) {
  EXPECT_EQ("0B", FormatBytes(0));
  EXPECT_EQ("1023B", FormatBytes(1023));
  EXPECT_EQ("1.00KB", FormatBytes(1024));
  EXPECT_EQ("8.00KB", FormatBytes(8192));
  EXPECT_EQ("1.50MB", FormatBytes(3 * 512 * 1024));
}

}  // namespace

}  // namespace assetspeed
