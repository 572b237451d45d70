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


#include "assetspeed/embedder/public/embedding_stats.h"

#include "assetspeed/embedder/public/asset_types.h"
#include "assetspeed/kernel/base/gtest.h"

namespace assetspeed {

namespace {

TEST(EmbeddingStatsTest, StartsEmpty) {
  EmbeddingStats stats;
  EXPECT_EQ(0, stats.total_assets);
  EXPECT_EQ(0, stats.size_before);
  EXPECT_EQ(0, stats.size_after);
  EXPECT_EQ(0, stats.inlined_bytes);
  EXPECT_EQ(0, stats.http_requests_saved);
}

TEST(EmbeddingStatsTest, InlineDataGrowsByEncodingOverhead) {
  EmbeddingStats stats;
  stats.RecordOccurrence(kInlineData, 1000);
  EXPECT_EQ(1, stats.total_assets);
  EXPECT_EQ(1, stats.inlined);
  EXPECT_EQ(1, stats.http_requests_saved);
  EXPECT_EQ(1000, stats.size_before);
  EXPECT_EQ(1370, stats.size_after);
  EXPECT_EQ(1000, stats.inlined_bytes);
}

TEST(EmbeddingStatsTest, OtherKindsKeepSize) {
  EmbeddingStats stats;
  stats.RecordOccurrence(kInlineText, 300);
  stats.RecordOccurrence(kExternalize, 5000);
  stats.RecordOccurrence(kDelegateUpload, 70000);
  EXPECT_EQ(3, stats.total_assets);
  EXPECT_EQ(1, stats.inlined);
  EXPECT_EQ(1, stats.externalized);
  EXPECT_EQ(1, stats.delegated);
  EXPECT_EQ(1, stats.http_requests_saved);
  EXPECT_EQ(75300, stats.size_before);
  EXPECT_EQ(75300, stats.size_after);
  EXPECT_EQ(0, stats.inlined_bytes);
}

TEST(EmbeddingStatsTest, CountsEveryOccurrence) {
  EmbeddingStats stats;
  for (int i = 0; i < 3; ++i) {
    stats.RecordOccurrence(kInlineData, 100);
  }
  EXPECT_EQ(3, stats.total_assets);
  EXPECT_EQ(3, stats.inlined);
  EXPECT_EQ(3, stats.http_requests_saved);
  EXPECT_EQ(300, stats.size_before);
  EXPECT_EQ(411, stats.size_after);
  EXPECT_EQ(300, stats.inlined_bytes);
  EXPECT_EQ(stats.total_assets,
            stats.inlined + stats.externalized + stats.delegated);
}

}  // namespace

}  // namespace assetspeed
