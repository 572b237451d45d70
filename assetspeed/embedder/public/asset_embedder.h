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


#ifndef ASSETSPEED_EMBEDDER_PUBLIC_ASSET_EMBEDDER_H_
#define ASSETSPEED_EMBEDDER_PUBLIC_ASSET_EMBEDDER_H_

#include "assetspeed/embedder/public/asset_profiler.h"
#include "assetspeed/embedder/public/asset_types.h"
#include "assetspeed/embedder/public/embedding_options.h"
#include "assetspeed/embedder/public/embedding_reporter.h"
#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

class HtmlParse;
class MessageHandler;
class Statistics;
class Variable;

struct EmbeddingResult {
  EmbeddingResult() : missing_assets(0) {}

  GoogleString html;
  AssetProfileMap profiles;
  AssetDecisionMap decisions;
  EmbeddingReport report;
  // Distinct referenced paths with no contents supplied.
  int missing_assets;
};

// Runs one document through the whole pipeline: extract references,
// profile the assets, decide, rewrite the document and report.
class AssetEmbedder {
 public:
  static const char kDocuments[];
  static const char kAssetsInlined[];
  static const char kAssetsExternalized[];
  static const char kAssetsDelegated[];
  static const char kHttpRequestsSaved[];
  static const char kMissingAssets[];

  static void InitStats(Statistics* statistics);

  // statistics must have been initialized with InitStats.
  AssetEmbedder(const EmbeddingOptions& options, MessageHandler* handler,
                Statistics* statistics);
  ~AssetEmbedder();

  // Rewrites html according to the embedding decisions for the assets it
  // references.  References to paths missing from assets are left alone.
  // Returns false only if the rewritten document could not be serialized.
  bool Embed(const StringPiece& url, const StringPiece& html,
             const AssetContentMap& assets, EmbeddingResult* result);

  // Profiles the assets html references without deciding or rewriting.
  void Analyze(const StringPiece& url, const StringPiece& html,
               const AssetContentMap& assets, AssetProfileMap* profiles,
               AssetSummary* summary);

  const EmbeddingOptions& options() const { return options_; }

 private:
  // Parses html into html_parse and profiles its references.  Returns
  // the number of referenced paths with no contents.
  int ParseAndProfile(const StringPiece& url, const StringPiece& html,
                      const AssetContentMap& assets, HtmlParse* html_parse,
                      AssetRecordMap* records, AssetProfileMap* profiles);

  EmbeddingOptions options_;
  MessageHandler* handler_;

  Variable* documents_;
  Variable* assets_inlined_;
  Variable* assets_externalized_;
  Variable* assets_delegated_;
  Variable* http_requests_saved_;
  Variable* missing_assets_;

  DISALLOW_COPY_AND_ASSIGN(AssetEmbedder);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_EMBEDDER_PUBLIC_ASSET_EMBEDDER_H_
