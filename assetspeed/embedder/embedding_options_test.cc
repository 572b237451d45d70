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


#include "assetspeed/embedder/public/embedding_options.h"

#include "assetspeed/embedder/public/asset_types.h"
#include "assetspeed/kernel/base/gtest.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

namespace {

class EmbeddingOptionsTest : public testing::Test {
 protected:
  EmbeddingOptions::OptionSettingResult Set(const StringPiece& name,
                                            const StringPiece& value) {
    msg_.clear();
    return options_.SetOptionFromName(name, value, &msg_);
  }

  EmbeddingOptions options_;
  GoogleString msg_;
};

TEST_F(EmbeddingOptionsTest, Defaults) {
  EXPECT_EQ(10240, options_.inline_threshold);
  EXPECT_EQ(8192, options_.image_inline_threshold);
  EXPECT_EQ(50000, options_.font_inline_threshold);
  EXPECT_DOUBLE_EQ(0.5, options_.modern_transport_multiplier);
  EXPECT_TRUE(options_.inline_data_uris);
  EXPECT_TRUE(options_.inline_vectors);
  EXPECT_FALSE(options_.optimize_for_modern_transport);
  EXPECT_TRUE(options_.respect_cache_hints);
  EXPECT_FALSE(options_.delegate_uploads);
  EXPECT_FALSE(options_.has_upload_target());
  EXPECT_EQ("/wp-content/uploads/", options_.upload_path_template);
}

TEST_F(EmbeddingOptionsTest, ThresholdForKind) {
  EXPECT_EQ(8192, options_.ThresholdFor(kMediaImage));
  EXPECT_EQ(50000, options_.ThresholdFor(kMediaFont));
  EXPECT_EQ(10240, options_.ThresholdFor(kMediaOther));
  EXPECT_EQ(10240, options_.ThresholdFor(kMediaVideo));
  EXPECT_DOUBLE_EQ(8192.0, options_.EffectiveThresholdFor(kMediaImage));
  options_.optimize_for_modern_transport = true;
  EXPECT_DOUBLE_EQ(4096.0, options_.EffectiveThresholdFor(kMediaImage));
  EXPECT_DOUBLE_EQ(25000.0, options_.EffectiveThresholdFor(kMediaFont));
  EXPECT_EQ(8192, options_.ThresholdFor(kMediaImage));
}

TEST_F(EmbeddingOptionsTest, ForTransport) {
  GoogleString reasoning;
  EmbeddingOptions multiplexed = EmbeddingOptions::ForTransport(true,
                                                                &reasoning);
  EXPECT_EQ(5120, multiplexed.inline_threshold);
  EXPECT_EQ(4096, multiplexed.image_inline_threshold);
  EXPECT_EQ(25000, multiplexed.font_inline_threshold);
  EXPECT_HAS_SUBSTR("HTTP/2", reasoning);

  EmbeddingOptions serial = EmbeddingOptions::ForTransport(false, &reasoning);
  EXPECT_EQ(10240, serial.inline_threshold);
  EXPECT_EQ(8192, serial.image_inline_threshold);
  EXPECT_EQ(50000, serial.font_inline_threshold);
  EXPECT_HAS_SUBSTR("HTTP/1.1", reasoning);

  // Reasoning is optional.
  EXPECT_EQ(4096,
            EmbeddingOptions::ForTransport(true, NULL).image_inline_threshold);
}

TEST_F(EmbeddingOptionsTest, QuickPreset) {
  EmbeddingOptions quick = EmbeddingOptions::QuickPreset();
  EXPECT_TRUE(quick.optimize_for_modern_transport);
  EXPECT_TRUE(quick.inline_data_uris);
  EXPECT_TRUE(quick.inline_vectors);
  EXPECT_FALSE(quick.delegate_uploads);
}

TEST_F(EmbeddingOptionsTest, SetThresholds) {
  EXPECT_EQ(EmbeddingOptions::kOptionOk, Set("InlineThreshold", "2048"));
  EXPECT_EQ(2048, options_.inline_threshold);
  EXPECT_EQ(EmbeddingOptions::kOptionOk, Set("imageinlinethreshold", " 0 "));
  EXPECT_EQ(0, options_.image_inline_threshold);
  EXPECT_EQ(EmbeddingOptions::kOptionOk, Set("FontInlineThreshold", "70000"));
  EXPECT_EQ(70000, options_.font_inline_threshold);

  EXPECT_EQ(EmbeddingOptions::kOptionValueInvalid,
            Set("InlineThreshold", "-1"));
  EXPECT_FALSE(msg_.empty());
  EXPECT_EQ(EmbeddingOptions::kOptionValueInvalid,
            Set("InlineThreshold", "big"));
  EXPECT_EQ(2048, options_.inline_threshold);
}

TEST_F(EmbeddingOptionsTest, SetMultiplier) {
  EXPECT_EQ(EmbeddingOptions::kOptionOk,
            Set("ModernTransportMultiplier", "0.25"));
  EXPECT_DOUBLE_EQ(0.25, options_.modern_transport_multiplier);
  EXPECT_EQ(EmbeddingOptions::kOptionOk,
            Set("ModernTransportMultiplier", "1"));
  EXPECT_EQ(EmbeddingOptions::kOptionValueInvalid,
            Set("ModernTransportMultiplier", "0"));
  EXPECT_EQ(EmbeddingOptions::kOptionValueInvalid,
            Set("ModernTransportMultiplier", "1.5"));
  EXPECT_DOUBLE_EQ(1.0, options_.modern_transport_multiplier);
}

TEST_F(EmbeddingOptionsTest, SetBooleans) {
  EXPECT_EQ(EmbeddingOptions::kOptionOk, Set("EnableDataUriInlining", "off"));
  EXPECT_FALSE(options_.inline_data_uris);
  EXPECT_EQ(EmbeddingOptions::kOptionOk, Set("EnableVectorInlining", "0"));
  EXPECT_FALSE(options_.inline_vectors);
  EXPECT_EQ(EmbeddingOptions::kOptionOk,
            Set("OptimizeForModernTransport", "TRUE"));
  EXPECT_TRUE(options_.optimize_for_modern_transport);
  EXPECT_EQ(EmbeddingOptions::kOptionOk, Set("RespectCacheHints", "false"));
  EXPECT_FALSE(options_.respect_cache_hints);
  EXPECT_EQ(EmbeddingOptions::kOptionOk, Set("EnableUploadDelegation", "on"));
  EXPECT_TRUE(options_.delegate_uploads);

  EXPECT_EQ(EmbeddingOptions::kOptionValueInvalid,
            Set("EnableVectorInlining", "maybe"));
  EXPECT_FALSE(options_.inline_vectors);
}

TEST_F(EmbeddingOptionsTest, SetUploadTarget) {
  EXPECT_EQ(EmbeddingOptions::kOptionOk,
            Set("UploadBaseUrl", " https://cdn.example.com "));
  EXPECT_EQ("https://cdn.example.com", options_.upload_base_url);
  EXPECT_TRUE(options_.has_upload_target());
  EXPECT_EQ(EmbeddingOptions::kOptionOk,
            Set("UploadPathTemplate", "/media/{filename}"));
  EXPECT_EQ("/media/{filename}", options_.upload_path_template);
}

TEST_F(EmbeddingOptionsTest, UnknownName) {
  EXPECT_EQ(EmbeddingOptions::kOptionNameUnknown, Set("NoSuchOption", "1"));
}

TEST_F(EmbeddingOptionsTest, Merge) {
  StringStringMap overrides;
  overrides["ImageInlineThreshold"] = "1000";
  overrides["EnableUploadDelegation"] = "true";
  overrides["UploadBaseUrl"] = "https://cdn.example.com";
  EXPECT_TRUE(options_.Merge(overrides, &msg_));
  EXPECT_EQ(1000, options_.image_inline_threshold);
  EXPECT_TRUE(options_.delegate_uploads);
  EXPECT_TRUE(options_.has_upload_target());
}

TEST_F(EmbeddingOptionsTest, MergeReportsFirstFailure) {
  StringStringMap overrides;
  overrides["Bogus"] = "1";
  EXPECT_FALSE(options_.Merge(overrides, &msg_));
  EXPECT_EQ("Unknown option Bogus", msg_);

  overrides.clear();
  overrides["InlineThreshold"] = "lots";
  EXPECT_FALSE(options_.Merge(overrides, &msg_));
  EXPECT_HAS_SUBSTR("Invalid value 'lots' for InlineThreshold", msg_);
}

TEST_F(EmbeddingOptionsTest, ToString) {
  GoogleString summary = options_.ToString();
  EXPECT_HAS_SUBSTR("thresholds=10240/8192/50000", summary);
  EXPECT_HAS_SUBSTR("modern=off", summary);
  EXPECT_HAS_SUBSTR_NE("upload=", summary);

  options_.delegate_uploads = true;
  options_.upload_base_url = "https://cdn.example.com";
  EXPECT_HAS_SUBSTR("upload=https://cdn.example.com/wp-content/uploads/",
                    options_.ToString());
}

}  // namespace

}  // namespace assetspeed
