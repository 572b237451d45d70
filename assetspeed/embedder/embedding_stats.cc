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


#include "assetspeed/embedder/public/embedding_stats.h"

#include "assetspeed/embedder/public/asset_decider.h"

namespace assetspeed {

void EmbeddingStats::RecordOccurrence(DecisionKind kind, int64 size) {
  ++total_assets;
  size_before += size;
  switch (kind) {
    case kInlineData:
      ++inlined;
      ++http_requests_saved;
      inlined_bytes += size;
      size_after += static_cast<int64>(
          size * (1.0 + AssetDecider::kBase64Overhead));
      break;
    case kInlineText:
      ++inlined;
      ++http_requests_saved;
      size_after += size;
      break;
    case kDelegateUpload:
      ++delegated;
      size_after += size;
      break;
    case kExternalize:
      ++externalized;
      size_after += size;
      break;
  }
}

}  // namespace assetspeed
