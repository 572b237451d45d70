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


#ifndef ASSETSPEED_EMBEDDER_PUBLIC_EMBEDDING_REPORTER_H_
#define ASSETSPEED_EMBEDDER_PUBLIC_EMBEDDING_REPORTER_H_

#include "assetspeed/embedder/public/asset_types.h"
#include "assetspeed/embedder/public/embedding_options.h"
#include "assetspeed/embedder/public/embedding_stats.h"
#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

class EmbeddingLog;

struct EmbeddingReport {
  EmbeddingReport() : reduction_percent(0) {}

  EmbeddingStats stats;
  // http_requests_saved as a rounded percentage of total_assets, 0 when
  // there were no assets.
  int reduction_percent;
  StringVector recommendations;
};

// Turns the decisions and rewrite totals of a pass into advice.  Each
// recommendation is evaluated independently; the final one always grades
// the request reduction.
class EmbeddingReporter {
 public:
  // Inline-data bytes above which the base64 overhead is worth a warning.
  static const int64 kLargeInlineTotal;
  // Inlined-asset count above which modern transport is suggested.
  static const int kManyInlinedAssets;
  // External assets above this size suggest upload delegation.
  static const int64 kLargeExternalAsset;

  static void Report(const AssetDecisionMap& decisions,
                     const EmbeddingStats& stats,
                     const EmbeddingOptions& options,
                     EmbeddingReport* report);

  // Copies a report and its decisions into a log record.
  static void PopulateLog(const StringPiece& url,
                          const AssetDecisionMap& decisions,
                          const EmbeddingReport& report,
                          EmbeddingLog* log);

 private:
  DISALLOW_IMPLICIT_CONSTRUCTORS(EmbeddingReporter);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_EMBEDDER_PUBLIC_EMBEDDING_REPORTER_H_
