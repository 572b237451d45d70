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


#include "assetspeed/kernel/http/data_url.h"

#include "assetspeed/kernel/base/gtest.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/http/content_type.h"

namespace assetspeed {

namespace {

const char kAsciiData[] =
    "A_Rather=Long,Nonsensical;String; with _0_ hint of base64";
const char kAsciiDataBase64[] =
    "QV9SYXRoZXI9TG9uZyxOb25zZW5zaWNhbDtTdHJpbmc7IHdpdGggXzBfIGhpbnQg"
    "b2YgYmFzZTY0";

class DataUrlTest : public testing::Test {
 protected:
  void TestDecoding(bool can_parse, bool can_decode,
                    const StringPiece& prefix, const StringPiece& encoded,
                    Encoding expected_encoding,
                    const StringPiece& expected_type,
                    const StringPiece& expected_content) {
    GoogleString url = StrCat(prefix, encoded);
    GoogleString mime_type;
    Encoding encoding;
    StringPiece encoded_content;
    ASSERT_EQ(can_parse,
              ParseDataUrl(url, &mime_type, &encoding, &encoded_content));
    EXPECT_EQ(expected_encoding, encoding);
    EXPECT_EQ(expected_type, mime_type);
    if (!can_parse) {
      return;
    }
    EXPECT_EQ(encoded, encoded_content);
    GoogleString decoded;
    EXPECT_EQ(can_decode,
              DecodeDataUrlContent(encoding, encoded_content, &decoded));
    if (can_decode) {
      EXPECT_EQ(expected_content, decoded);
    }
  }
};

TEST_F(DataUrlTest, TestDataPlain) {
  GoogleString url;
  DataUrl(kContentTypeSvg, PLAIN, "<svg/>", &url);
  EXPECT_EQ("data:image/svg+xml,<svg/>", url);
}

TEST_F(DataUrlTest, TestDataBase64) {
  GoogleString url;
  DataUrl(kContentTypePng, BASE64, kAsciiData, &url);
  EXPECT_EQ(StrCat("data:image/png;base64,", kAsciiDataBase64), url);
}

TEST_F(DataUrlTest, TestEmptyContent) {
  GoogleString url;
  DataUrl(kContentTypeGif, BASE64, "", &url);
  EXPECT_EQ("data:image/gif;base64,", url);
}

TEST_F(DataUrlTest, IsDataUrl) {
  EXPECT_TRUE(IsDataUrl("data:image/png;base64,AAAA"));
  EXPECT_TRUE(IsDataUrl("  DATA:,x"));
  EXPECT_FALSE(IsDataUrl("http://example.com/data:x"));
  EXPECT_FALSE(IsDataUrl("data.png"));
}

TEST_F(DataUrlTest, ParseDataUrls) {
  TestDecoding(true, true, "data:image/png;base64,", kAsciiDataBase64,
               BASE64, "image/png", kAsciiData);
  TestDecoding(true, true, "data:image/svg+xml,", "<svg/>",
               PLAIN, "image/svg+xml", "<svg/>");
  TestDecoding(true, true, "data:text/plain;charset=utf-8,", "x",
               PLAIN, "text/plain", "x");
  TestDecoding(true, false, "data:image/png;base64,", "@@@@",
               BASE64, "image/png", "");
}

TEST_F(DataUrlTest, ParseBadDataUrls) {
  TestDecoding(false, false, "http://example.com/a.png", "",
               UNKNOWN, "", "");
  TestDecoding(false, false, "data:image/png;base64", "", UNKNOWN, "", "");
}

}  // namespace

}  // namespace assetspeed
