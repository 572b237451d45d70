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


#include "assetspeed/kernel/http/content_type.h"

#include "assetspeed/kernel/base/gtest.h"
#include "assetspeed/kernel/base/string.h"

namespace assetspeed {

namespace {

class ContentTypeTest : public testing::Test {
 protected:
  // Returns the mime type for name, or "" if it is not recognized.
  GoogleString MimeType(const StringPiece& name) {
    const ContentType* type = NameExtensionToContentType(name);
    return (type == NULL) ? GoogleString() : type->mime_type();
  }
};

TEST_F(ContentTypeTest, TestUnknown) {
  EXPECT_TRUE(NameExtensionToContentType("file.xyz") == NULL);
  EXPECT_TRUE(NameExtensionToContentType("file") == NULL);
  EXPECT_TRUE(NameExtensionToContentType("") == NULL);
  EXPECT_TRUE(NameExtensionToContentType("dir.png/file") == NULL);
}

TEST_F(ContentTypeTest, TestMimeTypes) {
  EXPECT_EQ("image/jpeg", MimeType("a.jpg"));
  EXPECT_EQ("image/jpeg", MimeType("a.jpeg"));
  EXPECT_EQ("image/png", MimeType("a.png"));
  EXPECT_EQ("image/gif", MimeType("a.gif"));
  EXPECT_EQ("image/webp", MimeType("a.webp"));
  EXPECT_EQ("image/svg+xml", MimeType("a.svg"));
  EXPECT_EQ("font/woff2", MimeType("a.woff2"));
  EXPECT_EQ("font/woff", MimeType("a.woff"));
  EXPECT_EQ("font/ttf", MimeType("a.ttf"));
  EXPECT_EQ("video/mp4", MimeType("a.mp4"));
  EXPECT_EQ("video/ogg", MimeType("a.ogg"));
  EXPECT_EQ("audio/mpeg", MimeType("a.mp3"));
  EXPECT_EQ("application/octet-stream", MimeType("a.bin"));
}

TEST_F(ContentTypeTest, TestCaseAndQueryIgnored) {
  EXPECT_EQ("image/png", MimeType("IMG/Photo.PNG"));
  EXPECT_EQ("image/png", MimeType("a.png?v=3"));
  EXPECT_EQ("font/woff2", MimeType("fonts/f.woff2#iefix"));
  EXPECT_EQ("", MimeType("a.php?img=b.png"));
}

TEST_F(ContentTypeTest, TestCategories) {
  EXPECT_TRUE(kContentTypePng.IsImage());
  EXPECT_FALSE(kContentTypePng.IsVector());
  EXPECT_TRUE(kContentTypeSvg.IsImage());
  EXPECT_TRUE(kContentTypeSvg.IsVector());
  EXPECT_TRUE(kContentTypeWoff2.IsFont());
  EXPECT_FALSE(kContentTypeWoff2.IsImage());
  EXPECT_TRUE(NameExtensionToContentType("a.webm")->IsVideo());
  EXPECT_TRUE(NameExtensionToContentType("a.wav")->IsAudio());
  EXPECT_TRUE(NameExtensionToContentType("a.eot")->IsFont());
  EXPECT_FALSE(kContentTypeBinaryOctetStream.IsImage());
  EXPECT_FALSE(kContentTypeBinaryOctetStream.IsFont());
}

TEST_F(ContentTypeTest, TestLongCacheable) {
  EXPECT_TRUE(kContentTypeJpeg.IsLongCacheable());
  EXPECT_TRUE(kContentTypeSvg.IsLongCacheable());
  EXPECT_TRUE(NameExtensionToContentType("a.mp4")->IsLongCacheable());
  EXPECT_FALSE(NameExtensionToContentType("a.bmp")->IsLongCacheable());
  EXPECT_FALSE(NameExtensionToContentType("a.otf")->IsLongCacheable());
  EXPECT_FALSE(kContentTypeBinaryOctetStream.IsLongCacheable());
}

}  // namespace

}  // namespace assetspeed
