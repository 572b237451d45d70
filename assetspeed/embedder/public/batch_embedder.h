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


#ifndef ASSETSPEED_EMBEDDER_PUBLIC_BATCH_EMBEDDER_H_
#define ASSETSPEED_EMBEDDER_PUBLIC_BATCH_EMBEDDER_H_

#include <vector>

#include "assetspeed/embedder/public/asset_embedder.h"
#include "assetspeed/embedder/public/asset_types.h"
#include "assetspeed/embedder/public/embedding_options.h"
#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

class MessageHandler;
class Statistics;

// One page of a batch.  Option overrides are name/value pairs as accepted
// by EmbeddingOptions::SetOptionFromName, applied over the batch options.
struct PageRequest {
  GoogleString url;
  GoogleString html;
  AssetContentMap assets;
  StringStringMap option_overrides;
};

struct PageResult {
  PageResult() : success(false) {}

  GoogleString url;
  bool success;
  // Set when success is false.
  GoogleString error;
  EmbeddingResult result;
};

struct BatchSummary {
  BatchSummary() : total(0), successful(0), failed(0) {}

  int total;
  int successful;
  int failed;
};

// Embeds assets into a list of pages, one at a time.  A page that fails
// does not stop the batch; every page gets a result, in request order.
class BatchEmbedder {
 public:
  static const char kMissingInput[];

  // statistics must have been initialized with AssetEmbedder::InitStats.
  BatchEmbedder(const EmbeddingOptions& options, MessageHandler* handler,
                Statistics* statistics);
  ~BatchEmbedder();

  void Process(const std::vector<PageRequest>& pages,
               std::vector<PageResult>* results, BatchSummary* summary);

 private:
  bool ProcessPage(const PageRequest& page, PageResult* result);

  EmbeddingOptions options_;
  MessageHandler* handler_;
  Statistics* statistics_;

  DISALLOW_COPY_AND_ASSIGN(BatchEmbedder);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_EMBEDDER_PUBLIC_BATCH_EMBEDDER_H_
