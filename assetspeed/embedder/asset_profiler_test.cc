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


#include "assetspeed/embedder/public/asset_profiler.h"

#include <map>

#include "base/logging.h"
#include "assetspeed/embedder/public/asset_reference_extractor.h"
#include "assetspeed/embedder/public/asset_types.h"
#include "assetspeed/kernel/base/gtest.h"
#include "assetspeed/kernel/base/message_handler.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/html/html_parse_test_base.h"

namespace assetspeed {

namespace {

class AssetProfilerTest : public HtmlParseTestBase {
 protected:
  AssetProfilerTest()
      : extractor_(html_parse(), &references_),
        profiler_(&message_handler_),
        missing_(0),
        info_messages_(0) {
    html_parse()->AddFilter(&extractor_);
  }

  // Adds an asset of the given size, filled with 'x'.
  void AddAsset(const GoogleString& path, int size) {
    buffers_[path] = GoogleString(size, 'x');
    contents_[path] = buffers_[path];
  }

  void Profile(const StringPiece& html) {
    ValidateNoChanges("profile", html);
    info_messages_ = message_handler_.MessagesOfType(kInfo);
    records_.clear();
    profiles_.clear();
    missing_ = profiler_.Profile(references_, contents_, &records_,
                                 &profiles_);
  }

  const AssetProfile& profile(const GoogleString& path) {
    AssetProfileMap::const_iterator p = profiles_.find(path);
    CHECK(p != profiles_.end()) << path;
    return p->second;
  }

  AssetReferenceVector references_;
  AssetReferenceExtractor extractor_;
  AssetProfiler profiler_;
  std::map<GoogleString, GoogleString> buffers_;
  AssetContentMap contents_;
  AssetRecordMap records_;
  AssetProfileMap profiles_;
  int missing_;
  // Info messages logged before profiling started.
  int info_messages_;
};

TEST_F(AssetProfilerTest, CountsUsageAcrossContexts) {
  AddAsset("a.png", 100);
  Profile("<img src=a.png><div style='background:url(a.png)'></div>"
          "<style>p{background:url(a.png)}</style>");
  ASSERT_EQ(1, profiles_.size());
  const AssetProfile& a = profile("a.png");
  EXPECT_EQ("a.png", a.path);
  EXPECT_EQ(3, a.usage_count);
  EXPECT_EQ(100, a.size);
  EXPECT_EQ(kMediaImage, a.kind);
  EXPECT_TRUE(a.cacheable);
  ASSERT_EQ(1, records_.size());
  EXPECT_EQ(100, records_["a.png"].size());
}

TEST_F(AssetProfilerTest, ExcludesMissingAndUnreferenced) {
  AddAsset("a.png", 10);
  AddAsset("unused.png", 10);
  Profile("<img src=a.png><img src=missing.png><img src=missing.png>");
  EXPECT_EQ(1, profiles_.size());
  EXPECT_TRUE(profiles_.find("unused.png") == profiles_.end());
  EXPECT_TRUE(profiles_.find("missing.png") == profiles_.end());
  EXPECT_EQ(1, missing_);
  // One message for the missing path, however often it is referenced.
  EXPECT_EQ(1, message_handler_.MessagesOfType(kInfo) - info_messages_);
}

TEST_F(AssetProfilerTest, MediaKindsFromExtension) {
  AddAsset("a.svg", 10);
  AddAsset("f.woff2", 10);
  AddAsset("v.mp4", 10);
  AddAsset("s.mp3", 10);
  AddAsset("o.ogg", 10);
  AddAsset("u.xyz", 10);
  Profile("<img src=a.svg><video src=v.mp4></video><audio src=s.mp3></audio>"
          "<video src=o.ogg></video><img src=u.xyz>"
          "<div style='x:url(f.woff2)'></div>");
  EXPECT_EQ(kMediaImage, profile("a.svg").kind);
  EXPECT_EQ(kMediaFont, profile("f.woff2").kind);
  EXPECT_EQ(kMediaVideo, profile("v.mp4").kind);
  EXPECT_EQ(kMediaAudio, profile("s.mp3").kind);
  EXPECT_EQ(kMediaVideo, profile("o.ogg").kind);
  EXPECT_EQ(kMediaOther, profile("u.xyz").kind);
  EXPECT_FALSE(profile("u.xyz").cacheable);
}

TEST_F(AssetProfilerTest, FontFaceUrlWithoutExtensionIsFont) {
  AddAsset("/fonts/serve?family=x", 10);
  AddAsset("/bg", 10);
  Profile("<style>@font-face { src: url(/fonts/serve?family=x) }"
          "body { background: url(/bg) }</style>");
  EXPECT_EQ(kMediaFont, profile("/fonts/serve?family=x").kind);
  EXPECT_EQ(kMediaOther, profile("/bg").kind);
}

TEST_F(AssetProfilerTest, LaterFontFaceReferenceMakesFont) {
  AddAsset("/fonts/serve?family=x", 10);
  Profile("<div style='background:url(/fonts/serve?family=x)'></div>"
          "<style>@font-face { src: url(/fonts/serve?family=x) }</style>");
  EXPECT_EQ(kMediaFont, profile("/fonts/serve?family=x").kind);
  EXPECT_EQ(kMediaFont, records_["/fonts/serve?family=x"].kind);
  EXPECT_EQ(2, profile("/fonts/serve?family=x").usage_count);
}

TEST_F(AssetProfilerTest, FirstImagesAreCritical) {
  for (int i = 0; i < 7; ++i) {
    AddAsset(StrCat("i", IntegerToString(i), ".png"), 10);
  }
  Profile("<img src=i0.png><img src=i1.png><img src=i2.png><img src=i3.png>"
          "<img src=i4.png><img src=i5.png><img src=i6.png>");
  for (int i = 0; i < 7; ++i) {
    GoogleString path = StrCat("i", IntegerToString(i), ".png");
    EXPECT_EQ(i < AssetProfiler::kCriticalImageCount,
              profile(path).critical) << path;
  }
}

TEST_F(AssetProfilerTest, OrdinalCountsImagesWithoutContents) {
  AddAsset("late.png", 10);
  Profile("<img src=m0.png><img src=m1.png><img src=m2.png><img src=m3.png>"
          "<img src=m4.png><img src=late.png>");
  EXPECT_FALSE(profile("late.png").critical);
}

TEST_F(AssetProfilerTest, CriticalRegions) {
  AddAsset("header.png", 10);
  AddAsset("hero.png", 10);
  AddAsset("banner.png", 10);
  AddAsset("fold.png", 10);
  AddAsset("plain.png", 10);
  AddAsset("heroic.png", 10);
  GoogleString filler;
  for (int i = 0; i < AssetProfiler::kCriticalImageCount; ++i) {
    StrAppend(&filler, "<img src=filler.png>");
  }
  Profile(StrCat(filler,
                 "<header><div><img src=header.png></div></header>"
                 "<section class='big hero'><img src=hero.png></section>"
                 "<div class=banner><p><img src=banner.png></p></div>"
                 "<div class='main above-fold-area'><img src=fold.png></div>"
                 "<div class=heroic><img src=heroic.png></div>"
                 "<div><img src=plain.png></div>"));
  EXPECT_TRUE(profile("header.png").critical);
  EXPECT_TRUE(profile("hero.png").critical);
  EXPECT_TRUE(profile("banner.png").critical);
  EXPECT_TRUE(profile("fold.png").critical);
  EXPECT_FALSE(profile("heroic.png").critical);
  EXPECT_FALSE(profile("plain.png").critical);
}

TEST_F(AssetProfilerTest, OnlyFirstImageReferenceDecidesCriticality) {
  AddAsset("bg.png", 10);
  AddAsset("late.png", 10);
  GoogleString filler;
  for (int i = 0; i < AssetProfiler::kCriticalImageCount; ++i) {
    StrAppend(&filler, "<img src=filler.png>");
  }
  // CSS references in a hero region never make an asset critical, and a
  // later <img> in a hero region doesn't either.
  Profile(StrCat("<div class=hero style='background:url(bg.png)'></div>",
                 filler,
                 "<img src=late.png><div class=hero><img src=late.png></div>"));
  EXPECT_FALSE(profile("bg.png").critical);
  EXPECT_FALSE(profile("late.png").critical);
}

TEST_F(AssetProfilerTest, PreliminaryClassification) {
  AddAsset("small.png", 100);
  AddAsset("crit.png", 15000);
  AddAsset("shared.png", 15000);
  AddAsset("big.jpg", 60000);
  AddAsset("big.xyz", 60000);
  AddAsset("v.mp4", 100);
  GoogleString filler;
  for (int i = 0; i < AssetProfiler::kCriticalImageCount; ++i) {
    StrAppend(&filler, "<img src=filler.png>");
  }
  Profile(StrCat("<img src=crit.png>", filler,
                 "<img src=small.png><img src=shared.png><img src=shared.png>"
                 "<img src=big.jpg><img src=big.xyz><video src=v.mp4></video>"));
  EXPECT_EQ(kPreliminaryInline, profile("small.png").recommended_action);
  EXPECT_EQ("Small, single-use asset", profile("small.png").recommended_reason);
  EXPECT_EQ(kPreliminaryInline, profile("crit.png").recommended_action);
  EXPECT_EQ("Critical for LCP", profile("crit.png").recommended_reason);
  EXPECT_EQ(kPreliminaryExternal, profile("shared.png").recommended_action);
  EXPECT_EQ("Reused multiple times", profile("shared.png").recommended_reason);
  EXPECT_EQ(kPreliminaryUpload, profile("big.jpg").recommended_action);
  EXPECT_EQ(kPreliminaryExternal, profile("big.xyz").recommended_action);
  EXPECT_EQ("Default strategy", profile("big.xyz").recommended_reason);
  EXPECT_EQ(kPreliminaryExternal, profile("v.mp4").recommended_action);
  EXPECT_EQ("Media files are too large", profile("v.mp4").recommended_reason);
}

TEST_F(AssetProfilerTest, Summarize) {
  AddAsset("a.png", 100);
  AddAsset("b.woff", 300);
  Profile("<img src=a.png><img src=a.png>"
          "<style>@font-face{src:url(b.woff)}</style>");
  AssetSummary summary;
  AssetProfiler::Summarize(profiles_, &summary);
  EXPECT_EQ(2, summary.total_assets);
  EXPECT_EQ(400, summary.total_size);
  EXPECT_EQ(200, summary.average_size);
  EXPECT_EQ(1, summary.count_by_kind["image"]);
  EXPECT_EQ(1, summary.count_by_kind["font"]);
  EXPECT_EQ(2, summary.usage_counts["a.png"]);
  ASSERT_EQ(1, summary.critical_paths.size());
  EXPECT_EQ("a.png", summary.critical_paths[0]);
}

TEST_F(AssetProfilerTest, SummarizeNothing) {
  AssetSummary summary;
  AssetProfiler::Summarize(AssetProfileMap(), &summary);
  EXPECT_EQ(0, summary.total_assets);
  EXPECT_EQ(0, summary.average_size);
}

}  // namespace

}  // namespace assetspeed
