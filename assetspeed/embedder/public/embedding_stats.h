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


#ifndef ASSETSPEED_EMBEDDER_PUBLIC_EMBEDDING_STATS_H_
#define ASSETSPEED_EMBEDDER_PUBLIC_EMBEDDING_STATS_H_

#include "assetspeed/embedder/public/asset_types.h"
#include "assetspeed/kernel/base/basictypes.h"

namespace assetspeed {

// Running totals kept while a document is rewritten.  Every occurrence of
// a decided asset counts once, so an asset referenced three times adds
// three to total_assets.
struct EmbeddingStats {
  EmbeddingStats()
      : total_assets(0), inlined(0), externalized(0), delegated(0),
        size_before(0), size_after(0), inlined_bytes(0),
        http_requests_saved(0) {}

  // Accounts for one occurrence of an asset of the given size that was
  // handled as kind.
  void RecordOccurrence(DecisionKind kind, int64 size);

  int total_assets;
  int inlined;
  int externalized;
  int delegated;
  int64 size_before;
  int64 size_after;
  // Original bytes written into data: URLs, summed over occurrences.
  int64 inlined_bytes;
  int http_requests_saved;
};

}  // namespace assetspeed

#endif  // ASSETSPEED_EMBEDDER_PUBLIC_EMBEDDING_STATS_H_
