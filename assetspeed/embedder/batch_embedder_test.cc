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


#include "assetspeed/embedder/public/batch_embedder.h"

#include <vector>

#include "assetspeed/embedder/public/asset_embedder.h"
#include "assetspeed/embedder/public/embedding_options.h"
#include "assetspeed/kernel/base/gtest.h"
#include "assetspeed/kernel/base/mock_message_handler.h"
#include "assetspeed/kernel/base/null_mutex.h"
#include "assetspeed/kernel/base/null_thread_system.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/util/simple_stats.h"

namespace assetspeed {

namespace {

class BatchEmbedderTest : public testing::Test {
 protected:
  BatchEmbedderTest()
      : handler_(new NullMutex),
        stats_(&thread_system_),
        icon_(500, 'i') {
    AssetEmbedder::InitStats(&stats_);
  }

  PageRequest* AddPage(const StringPiece& url, const StringPiece& html) {
    pages_.push_back(PageRequest());
    PageRequest* page = &pages_.back();
    url.CopyToString(&page->url);
    html.CopyToString(&page->html);
    page->assets["icon.png"] = icon_;
    return page;
  }

  void Process() {
    BatchEmbedder batch(options_, &handler_, &stats_);
    batch.Process(pages_, &results_, &summary_);
  }

  MockMessageHandler handler_;
  NullThreadSystem thread_system_;
  SimpleStats stats_;
  EmbeddingOptions options_;
  GoogleString icon_;
  std::vector<PageRequest> pages_;
  std::vector<PageResult> results_;
  BatchSummary summary_;
};

TEST_F(BatchEmbedderTest, ProcessesEveryPageInOrder) {
  AddPage("http://a.com/", "<img src=icon.png>");
  AddPage("http://b.com/", "<p>no images</p>");
  Process();
  ASSERT_EQ(2, results_.size());
  EXPECT_EQ("http://a.com/", results_[0].url);
  EXPECT_TRUE(results_[0].success);
  EXPECT_TRUE(results_[0].error.empty());
  EXPECT_HAS_SUBSTR("data:image/png;base64,", results_[0].result.html);
  EXPECT_EQ("http://b.com/", results_[1].url);
  EXPECT_TRUE(results_[1].success);
  EXPECT_EQ("<p>no images</p>", results_[1].result.html);

  EXPECT_EQ(2, summary_.total);
  EXPECT_EQ(2, summary_.successful);
  EXPECT_EQ(0, summary_.failed);
  EXPECT_EQ(2, stats_.GetVariable(AssetEmbedder::kDocuments)->Get());
}

TEST_F(BatchEmbedderTest, EmptyPageFailsWithoutStoppingBatch) {
  AddPage("http://empty.com/", "");
  AddPage("http://a.com/", "<img src=icon.png>");
  Process();
  ASSERT_EQ(2, results_.size());
  EXPECT_FALSE(results_[0].success);
  EXPECT_EQ(BatchEmbedder::kMissingInput, results_[0].error);
  EXPECT_TRUE(results_[1].success);
  EXPECT_EQ(2, summary_.total);
  EXPECT_EQ(1, summary_.successful);
  EXPECT_EQ(1, summary_.failed);
  EXPECT_EQ(1, handler_.MessagesOfType(kWarning));
}

TEST_F(BatchEmbedderTest, PageOverridesApplyToThatPageOnly) {
  PageRequest* page = AddPage("http://a.com/", "<img src=icon.png>");
  page->option_overrides["EnableDataUriInlining"] = "off";
  AddPage("http://b.com/", "<img src=icon.png>");
  Process();
  ASSERT_EQ(2, results_.size());
  EXPECT_EQ("<img src=icon.png>", results_[0].result.html);
  EXPECT_EQ(kExternalize,
            results_[0].result.decisions["icon.png"].kind);
  EXPECT_EQ(kInlineData, results_[1].result.decisions["icon.png"].kind);
}

TEST_F(BatchEmbedderTest, BadOverrideFailsPage) {
  PageRequest* page = AddPage("http://a.com/", "<img src=icon.png>");
  page->option_overrides["InlineThreshold"] = "huge";
  AddPage("http://b.com/", "<p>x</p>");
  page = AddPage("http://c.com/", "<p>x</p>");
  page->option_overrides["NotAnOption"] = "1";
  Process();
  ASSERT_EQ(3, results_.size());
  EXPECT_FALSE(results_[0].success);
  EXPECT_HAS_SUBSTR("InlineThreshold", results_[0].error);
  EXPECT_TRUE(results_[1].success);
  EXPECT_FALSE(results_[2].success);
  EXPECT_EQ("Unknown option NotAnOption", results_[2].error);
  EXPECT_EQ(2, summary_.failed);
  EXPECT_EQ(1, stats_.GetVariable(AssetEmbedder::kDocuments)->Get());
}

TEST_F(BatchEmbedderTest, EmptyBatch) {
  Process();
  EXPECT_TRUE(results_.empty());
  EXPECT_EQ(0, summary_.total);
  EXPECT_EQ(0, summary_.successful);
  EXPECT_EQ(0, summary_.failed);
}

}  // namespace

}  // namespace assetspeed
