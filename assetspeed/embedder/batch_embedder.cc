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

#include "assetspeed/kernel/base/message_handler.h"

namespace assetspeed {

const char BatchEmbedder::kMissingInput[] = "Missing HTML or assets";

BatchEmbedder::BatchEmbedder(const EmbeddingOptions& options,
                             MessageHandler* handler,
                             Statistics* statistics)
    : options_(options),
      handler_(handler),
      statistics_(statistics) {
}

BatchEmbedder::~BatchEmbedder() {
}

void BatchEmbedder::Process(const std::vector<PageRequest>& pages,
                            std::vector<PageResult>* results,
                            BatchSummary* summary) {
  results->clear();
  results->resize(pages.size());
  *summary = BatchSummary();
  for (int i = 0, n = pages.size(); i < n; ++i) {
    PageResult* result = &(*results)[i];
    result->url = pages[i].url;
    result->success = ProcessPage(pages[i], result);
    ++summary->total;
    if (result->success) {
      ++summary->successful;
    } else {
      ++summary->failed;
      handler_->Message(kWarning, "%s: %s", result->url.c_str(),
                        result->error.c_str());
    }
  }
  handler_->Message(kInfo, "Batch complete: %d pages, %d succeeded, "
                    "%d failed", summary->total, summary->successful,
                    summary->failed);
}

bool BatchEmbedder::ProcessPage(const PageRequest& page, PageResult* result) {
  if (page.html.empty()) {
    result->error = kMissingInput;
    return false;
  }
  EmbeddingOptions options = options_;
  if (!options.Merge(page.option_overrides, &result->error)) {
    return false;
  }
  AssetEmbedder embedder(options, handler_, statistics_);
  if (!embedder.Embed(page.url, page.html, page.assets, &result->result)) {
    result->error = "Could not serialize the rewritten document";
    return false;
  }
  return true;
}

}  // namespace assetspeed
