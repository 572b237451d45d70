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


#include "assetspeed/embedder/public/asset_embedder.h"

#include "assetspeed/embedder/public/asset_decider.h"
#include "assetspeed/embedder/public/asset_reference_extractor.h"
#include "assetspeed/embedder/public/asset_rewrite_filter.h"
#include "assetspeed/kernel/base/message_handler.h"
#include "assetspeed/kernel/base/statistics.h"
#include "assetspeed/kernel/base/string_writer.h"
#include "assetspeed/kernel/html/html_parse.h"
#include "assetspeed/kernel/html/html_writer_filter.h"

namespace assetspeed {

const char AssetEmbedder::kDocuments[] = "asset_embedder_documents";
const char AssetEmbedder::kAssetsInlined[] = "asset_embedder_assets_inlined";
const char AssetEmbedder::kAssetsExternalized[] =
    "asset_embedder_assets_externalized";
const char AssetEmbedder::kAssetsDelegated[] =
    "asset_embedder_assets_delegated";
const char AssetEmbedder::kHttpRequestsSaved[] =
    "asset_embedder_http_requests_saved";
const char AssetEmbedder::kMissingAssets[] = "asset_embedder_missing_assets";

void AssetEmbedder::InitStats(Statistics* statistics) {
  statistics->AddVariable(kDocuments);
  statistics->AddVariable(kAssetsInlined);
  statistics->AddVariable(kAssetsExternalized);
  statistics->AddVariable(kAssetsDelegated);
  statistics->AddVariable(kHttpRequestsSaved);
  statistics->AddVariable(kMissingAssets);
}

AssetEmbedder::AssetEmbedder(const EmbeddingOptions& options,
                             MessageHandler* handler,
                             Statistics* statistics)
    : options_(options),
      handler_(handler),
      documents_(statistics->GetVariable(kDocuments)),
      assets_inlined_(statistics->GetVariable(kAssetsInlined)),
      assets_externalized_(statistics->GetVariable(kAssetsExternalized)),
      assets_delegated_(statistics->GetVariable(kAssetsDelegated)),
      http_requests_saved_(statistics->GetVariable(kHttpRequestsSaved)),
      missing_assets_(statistics->GetVariable(kMissingAssets)) {
}

AssetEmbedder::~AssetEmbedder() {
}

int AssetEmbedder::ParseAndProfile(
    const StringPiece& url, const StringPiece& html,
    const AssetContentMap& assets, HtmlParse* html_parse,
    AssetRecordMap* records, AssetProfileMap* profiles) {
  AssetReferenceVector references;
  AssetReferenceExtractor extractor(html_parse, &references);
  html_parse->StartParse(url);
  html_parse->ParseText(html);
  html_parse->FinishParse();
  html_parse->ApplyFilter(&extractor);

  AssetProfiler profiler(handler_);
  int missing = profiler.Profile(references, assets, records, profiles);
  PS_DLOG_INFO(handler_, "%s: %d references to %d profiled assets",
               html_parse->url().c_str(), static_cast<int>(references.size()),
               static_cast<int>(profiles->size()));
  return missing;
}

bool AssetEmbedder::Embed(const StringPiece& url, const StringPiece& html,
                          const AssetContentMap& assets,
                          EmbeddingResult* result) {
  HtmlParse html_parse(handler_);
  AssetRecordMap records;
  result->profiles.clear();
  result->decisions.clear();
  result->missing_assets = ParseAndProfile(url, html, assets, &html_parse,
                                           &records, &result->profiles);

  AssetDecider decider(options_);
  decider.DecideAll(records, result->profiles, &result->decisions);
  for (AssetDecisionMap::const_iterator p = result->decisions.begin(),
           e = result->decisions.end(); p != e; ++p) {
    const AssetDecision& decision = p->second;
    if (decision.rule == AssetDecider::kMediaRule) {
      handler_->Message(kWarning, "%s: %s stays external: %s",
                        html_parse.url().c_str(), decision.path.c_str(),
                        decision.warnings[0].c_str());
    } else {
      handler_->Message(kInfo, "%s: %s %s by %s: %s",
                        html_parse.url().c_str(), decision.path.c_str(),
                        DecisionKindName(decision.kind), decision.rule.c_str(),
                        decision.reason.c_str());
    }
  }

  AssetRewriteFilter rewriter(&html_parse, &result->decisions);
  html_parse.ApplyFilter(&rewriter);

  result->html.clear();
  StringWriter writer(&result->html);
  HtmlWriterFilter writer_filter(&html_parse);
  writer_filter.set_writer(&writer);
  html_parse.ApplyFilter(&writer_filter);
  bool ok = (writer_filter.write_errors() == 0);

  const EmbeddingStats& stats = rewriter.stats();
  EmbeddingReporter::Report(result->decisions, stats, options_,
                            &result->report);

  documents_->Add(1);
  assets_inlined_->Add(stats.inlined);
  assets_externalized_->Add(stats.externalized);
  assets_delegated_->Add(stats.delegated);
  http_requests_saved_->Add(stats.http_requests_saved);
  missing_assets_->Add(result->missing_assets);

  handler_->Message(kInfo, "%s: %d asset references, %d inlined, "
                    "%d external, %d delegated, %d requests saved",
                    html_parse.url().c_str(), stats.total_assets,
                    stats.inlined, stats.externalized, stats.delegated,
                    stats.http_requests_saved);
  return ok;
}

void AssetEmbedder::Analyze(const StringPiece& url, const StringPiece& html,
                            const AssetContentMap& assets,
                            AssetProfileMap* profiles,
                            AssetSummary* summary) {
  HtmlParse html_parse(handler_);
  AssetRecordMap records;
  profiles->clear();
  missing_assets_->Add(
      ParseAndProfile(url, html, assets, &html_parse, &records, profiles));
  AssetProfiler::Summarize(*profiles, summary);
}

}  // namespace assetspeed
