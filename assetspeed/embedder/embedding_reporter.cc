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

#include <cmath>

#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/opt/logging/embedding_log.pb.h"

namespace assetspeed {

const int64 EmbeddingReporter::kLargeInlineTotal = 50000;
const int EmbeddingReporter::kManyInlinedAssets = 10;
const int64 EmbeddingReporter::kLargeExternalAsset = 100000;

namespace {

const int kExcellentReductionPercent = 30;
const int kGoodReductionPercent = 10;

AssetDecisionLog::MediaKind ToLogMediaKind(MediaKind kind) {
  switch (kind) {
    case kMediaImage: return AssetDecisionLog::IMAGE;
    case kMediaFont:  return AssetDecisionLog::FONT;
    case kMediaVideo: return AssetDecisionLog::VIDEO;
    case kMediaAudio: return AssetDecisionLog::AUDIO;
    case kMediaOther: return AssetDecisionLog::OTHER;
  }
  return AssetDecisionLog::OTHER;
}

AssetDecisionLog::Decision ToLogDecision(DecisionKind kind) {
  switch (kind) {
    case kInlineData:     return AssetDecisionLog::INLINE_DATA;
    case kInlineText:     return AssetDecisionLog::INLINE_TEXT;
    case kExternalize:    return AssetDecisionLog::EXTERNALIZE;
    case kDelegateUpload: return AssetDecisionLog::DELEGATE_UPLOAD;
  }
  return AssetDecisionLog::EXTERNALIZE;
}

}  // namespace

void EmbeddingReporter::Report(const AssetDecisionMap& decisions,
                               const EmbeddingStats& stats,
                               const EmbeddingOptions& options,
                               EmbeddingReport* report) {
  report->stats = stats;
  report->recommendations.clear();
  StringVector* out = &report->recommendations;

  if (stats.http_requests_saved > 0) {
    out->push_back(StrCat("Saved ", IntegerToString(stats.http_requests_saved),
                          " HTTP requests by inlining small assets"));
  }

  int large_external = 0;
  StringVector critical_external;
  for (AssetDecisionMap::const_iterator p = decisions.begin(),
           e = decisions.end(); p != e; ++p) {
    const AssetDecision& decision = p->second;
    if (decision.kind == kExternalize) {
      if (decision.original_size > kLargeExternalAsset) {
        ++large_external;
      }
      if (decision.critical) {
        critical_external.push_back(decision.path);
      }
    }
  }

  if (stats.inlined_bytes > kLargeInlineTotal) {
    out->push_back(StringPrintf(
        "%.2fKB of assets inlined. This increases HTML size by ~37%% due to "
        "Base64 encoding.", stats.inlined_bytes / 1024.0));
  }
  if (!options.optimize_for_modern_transport &&
      stats.inlined > kManyInlinedAssets) {
    out->push_back("Consider enabling modern transport (HTTP/2) optimization "
                   "to lower inline thresholds");
  }
  if (large_external > 0 && !options.delegate_uploads) {
    out->push_back(StrCat(IntegerToString(large_external),
                          " large assets (>100KB) detected. Consider enabling "
                          "upload delegation to serve them from managed "
                          "storage."));
  }
  for (int i = 0, n = critical_external.size(); i < n; ++i) {
    out->push_back(StrCat("Critical asset ", critical_external[i],
                          " is still loaded externally; consider inlining or "
                          "preloading it"));
  }

  report->reduction_percent = 0;
  if (stats.total_assets > 0) {
    report->reduction_percent = static_cast<int>(std::floor(
        100.0 * stats.http_requests_saved / stats.total_assets + 0.5));
  }
  GoogleString percent = IntegerToString(report->reduction_percent);
  if (report->reduction_percent >= kExcellentReductionPercent) {
    out->push_back(StrCat("Excellent! Reduced HTTP requests by ", percent,
                          "%"));
  } else if (report->reduction_percent >= kGoodReductionPercent) {
    out->push_back(StrCat("Good! Reduced HTTP requests by ", percent, "%"));
  } else {
    out->push_back(StrCat("Consider adjusting thresholds to inline more small "
                          "assets (current: ", percent, "% reduction)"));
  }
}

void EmbeddingReporter::PopulateLog(const StringPiece& url,
                                    const AssetDecisionMap& decisions,
                                    const EmbeddingReport& report,
                                    EmbeddingLog* log) {
  const EmbeddingStats& stats = report.stats;
  log->set_url(url.data(), url.size());
  log->set_total_assets(stats.total_assets);
  log->set_inlined(stats.inlined);
  log->set_externalized(stats.externalized);
  log->set_delegated(stats.delegated);
  log->set_size_before(stats.size_before);
  log->set_size_after(stats.size_after);
  log->set_http_requests_saved(stats.http_requests_saved);
  log->set_reduction_percent(report.reduction_percent);
  for (int i = 0, n = report.recommendations.size(); i < n; ++i) {
    log->add_recommendations(report.recommendations[i]);
  }

  for (AssetDecisionMap::const_iterator p = decisions.begin(),
           e = decisions.end(); p != e; ++p) {
    const AssetDecision& decision = p->second;
    AssetDecisionLog* entry = log->add_decisions();
    entry->set_path(decision.path);
    entry->set_media_kind(ToLogMediaKind(decision.media_kind));
    entry->set_decision(ToLogDecision(decision.kind));
    entry->set_rule(decision.rule);
    entry->set_original_size(decision.original_size);
    entry->set_reason(decision.reason);
    for (int i = 0, n = decision.warnings.size(); i < n; ++i) {
      entry->add_warnings(decision.warnings[i]);
    }
    entry->set_critical(decision.critical);
    if (decision.kind == kInlineData || decision.kind == kInlineText) {
      entry->set_payload_size(decision.payload.size());
    }
    if (!decision.target_url.empty()) {
      entry->set_target_url(decision.target_url);
    }
  }
}

}  // namespace assetspeed
