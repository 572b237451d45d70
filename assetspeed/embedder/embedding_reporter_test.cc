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


#include "assetspeed/embedder/public/embedding_reporter.h"

#include "assetspeed/embedder/public/asset_types.h"
#include "assetspeed/embedder/public/embedding_options.h"
#include "assetspeed/embedder/public/embedding_stats.h"
#include "assetspeed/kernel/base/gtest.h"
#include "assetspeed/kernel/base/proto_util.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/opt/logging/embedding_log.pb.h"

namespace assetspeed {

namespace {

class EmbeddingReporterTest : public testing::Test {
 protected:
  void AddDecision(const StringPiece& path, DecisionKind kind, int64 size,
                   bool critical) {
    AssetDecision* decision = &decisions_[path.as_string()];
    path.CopyToString(&decision->path);
    decision->kind = kind;
    decision->original_size = size;
    decision->critical = critical;
    decision->media_kind = kMediaImage;
    stats_.RecordOccurrence(kind, size);
  }

  void Report() {
    EmbeddingReporter::Report(decisions_, stats_, options_, &report_);
  }

  bool HasRecommendation(const StringPiece& text) const {
    for (int i = 0, n = report_.recommendations.size(); i < n; ++i) {
      if (report_.recommendations[i].find(text.as_string()) !=
          GoogleString::npos) {
        return true;
      }
    }
    return false;
  }

  AssetDecisionMap decisions_;
  EmbeddingStats stats_;
  EmbeddingOptions options_;
  EmbeddingReport report_;
};

TEST_F(EmbeddingReporterTest, NoAssets) {
  Report();
  EXPECT_EQ(0, report_.reduction_percent);
  ASSERT_EQ(1, report_.recommendations.size());
  EXPECT_EQ("Consider adjusting thresholds to inline more small assets "
            "(current: 0% reduction)", report_.recommendations[0]);
}

TEST_F(EmbeddingReporterTest, SavedRequestsAndExcellentReduction) {
  AddDecision("a.png", kInlineData, 1000, false);
  AddDecision("b.png", kInlineData, 1000, false);
  AddDecision("c.jpg", kExternalize, 20000, false);
  Report();
  EXPECT_EQ(67, report_.reduction_percent);
  EXPECT_EQ(3, report_.stats.total_assets);
  ASSERT_EQ(2, report_.recommendations.size());
  EXPECT_EQ("Saved 2 HTTP requests by inlining small assets",
            report_.recommendations[0]);
  EXPECT_EQ("Excellent! Reduced HTTP requests by 67%",
            report_.recommendations[1]);
}

TEST_F(EmbeddingReporterTest, GoodReduction) {
  AddDecision("a.png", kInlineData, 1000, false);
  for (int i = 0; i < 4; ++i) {
    AddDecision(StrCat("big", IntegerToString(i), ".jpg"), kExternalize,
                20000, false);
  }
  Report();
  EXPECT_EQ(20, report_.reduction_percent);
  EXPECT_TRUE(HasRecommendation("Good! Reduced HTTP requests by 20%"));
}

TEST_F(EmbeddingReporterTest, ReductionRoundsHalfUp) {
  // 1 of 8 is 12.5%.
  AddDecision("a.png", kInlineData, 10, false);
  for (int i = 0; i < 7; ++i) {
    AddDecision(StrCat("x", IntegerToString(i), ".jpg"), kExternalize, 20000,
                false);
  }
  Report();
  EXPECT_EQ(13, report_.reduction_percent);
}

TEST_F(EmbeddingReporterTest, LargeInlineTotalWarnsAboutOverhead) {
  AddDecision("a.woff2", kInlineData, 30000, false);
  AddDecision("b.woff2", kInlineData, 30000, false);
  Report();
  EXPECT_TRUE(HasRecommendation("58.59KB of assets inlined. This increases "
                                "HTML size by ~37% due to Base64 encoding."));
}

TEST_F(EmbeddingReporterTest, OverheadCountsEveryInlinedOccurrence) {
  // One 8000-byte decision written into the document seven times.
  AddDecision("icon.png", kInlineData, 8000, false);
  for (int i = 1; i < 7; ++i) {
    stats_.RecordOccurrence(kInlineData, 8000);
  }
  Report();
  EXPECT_TRUE(HasRecommendation("54.69KB of assets inlined."));
}

TEST_F(EmbeddingReporterTest, SingleOccurrenceBelowOverheadLimit) {
  AddDecision("icon.png", kInlineData, 8000, false);
  Report();
  EXPECT_FALSE(HasRecommendation("Base64"));
}

TEST_F(EmbeddingReporterTest, InlineTextDoesNotCountTowardOverhead) {
  AddDecision("a.svg", kInlineText, 60000, false);
  Report();
  EXPECT_FALSE(HasRecommendation("Base64"));
}

TEST_F(EmbeddingReporterTest, ManyInlinedAssetsSuggestModernTransport) {
  for (int i = 0; i < 11; ++i) {
    AddDecision(StrCat("i", IntegerToString(i), ".png"), kInlineData, 10,
                false);
  }
  Report();
  EXPECT_TRUE(HasRecommendation("Consider enabling modern transport"));

  options_.optimize_for_modern_transport = true;
  Report();
  EXPECT_FALSE(HasRecommendation("Consider enabling modern transport"));
}

TEST_F(EmbeddingReporterTest, TenInlinedAssetsAreNotMany) {
  for (int i = 0; i < 10; ++i) {
    AddDecision(StrCat("i", IntegerToString(i), ".png"), kInlineData, 10,
                false);
  }
  Report();
  EXPECT_FALSE(HasRecommendation("modern transport"));
}

TEST_F(EmbeddingReporterTest, LargeExternalAssetsSuggestDelegation) {
  AddDecision("a.jpg", kExternalize, 150000, false);
  AddDecision("b.jpg", kExternalize, 200000, false);
  AddDecision("c.jpg", kExternalize, 100000, false);
  Report();
  EXPECT_TRUE(HasRecommendation(
      "2 large assets (>100KB) detected. Consider enabling upload "
      "delegation"));

  options_.delegate_uploads = true;
  Report();
  EXPECT_FALSE(HasRecommendation("large assets"));
}

TEST_F(EmbeddingReporterTest, CriticalExternalAssets) {
  AddDecision("hero.jpg", kExternalize, 90000, true);
  AddDecision("logo.png", kInlineData, 100, true);
  Report();
  EXPECT_TRUE(HasRecommendation("Critical asset hero.jpg is still loaded "
                                "externally"));
  EXPECT_FALSE(HasRecommendation("logo.png"));
}

TEST_F(EmbeddingReporterTest, ReductionGradeIsLast) {
  AddDecision("hero.jpg", kExternalize, 200000, true);
  Report();
  ASSERT_FALSE(report_.recommendations.empty());
  EXPECT_HAS_SUBSTR("Consider adjusting thresholds",
                    report_.recommendations.back());
}

TEST_F(EmbeddingReporterTest, PopulateLog) {
  AddDecision("a.png", kInlineData, 1000, false);
  decisions_["a.png"].payload = "data:image/png;base64,AAAA";
  decisions_["a.png"].rule = "size-inline";
  decisions_["a.png"].reason = "small";
  AddDecision("b.jpg", kDelegateUpload, 70000, false);
  decisions_["b.jpg"].target_url = "https://cdn.example.com/b.jpg";
  decisions_["b.jpg"].warnings.push_back("careful");
  Report();

  EmbeddingLog log;
  EmbeddingReporter::PopulateLog("http://example.com/", decisions_, report_,
                                 &log);
  EXPECT_EQ("http://example.com/", log.url());
  EXPECT_EQ(2, log.total_assets());
  EXPECT_EQ(1, log.inlined());
  EXPECT_EQ(1, log.delegated());
  EXPECT_EQ(0, log.externalized());
  EXPECT_EQ(71000, log.size_before());
  EXPECT_EQ(1, log.http_requests_saved());
  EXPECT_EQ(50, log.reduction_percent());
  EXPECT_EQ(report_.recommendations.size(), log.recommendations_size());

  ASSERT_EQ(2, log.decisions_size());
  const AssetDecisionLog& inlined = log.decisions(0);
  EXPECT_EQ("a.png", inlined.path());
  EXPECT_EQ(AssetDecisionLog::INLINE_DATA, inlined.decision());
  EXPECT_EQ(AssetDecisionLog::IMAGE, inlined.media_kind());
  EXPECT_EQ("size-inline", inlined.rule());
  EXPECT_EQ(26, inlined.payload_size());
  EXPECT_FALSE(inlined.has_target_url());

  const AssetDecisionLog& delegated = log.decisions(1);
  EXPECT_EQ(AssetDecisionLog::DELEGATE_UPLOAD, delegated.decision());
  EXPECT_EQ("https://cdn.example.com/b.jpg", delegated.target_url());
  EXPECT_FALSE(delegated.has_payload_size());
  ASSERT_EQ(1, delegated.warnings_size());
  EXPECT_EQ("careful", delegated.warnings(0));
}

TEST_F(EmbeddingReporterTest, LogSurvivesTextFormat) {
  AddDecision("a.png", kInlineData, 1000, false);
  decisions_["a.png"].payload = "data:image/png;base64,AAAA";
  AddDecision("c.jpg", kExternalize, 200000, true);
  Report();
  EmbeddingLog log;
  EmbeddingReporter::PopulateLog("http://example.com/", decisions_, report_,
                                 &log);

  GoogleString text;
  ASSERT_TRUE(PrintTextFormatProtoToString(log, &text));
  EXPECT_HAS_SUBSTR("url: \"http://example.com/\"", text);
  EmbeddingLog parsed;
  ASSERT_TRUE(ParseTextFormatProtoFromString(text, &parsed));
  EXPECT_EQ(log.SerializeAsString(), parsed.SerializeAsString());
  EXPECT_EQ(4, parsed.recommendations_size());
  ASSERT_EQ(2, parsed.decisions_size());
  EXPECT_TRUE(parsed.decisions(1).critical());
}

}  // namespace

}  // namespace assetspeed
