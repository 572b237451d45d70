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


#ifndef ASSETSPEED_EMBEDDER_PUBLIC_ASSET_DECIDER_H_
#define ASSETSPEED_EMBEDDER_PUBLIC_ASSET_DECIDER_H_

#include "assetspeed/embedder/public/asset_types.h"
#include "assetspeed/embedder/public/embedding_options.h"
#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

// Chooses, for each profiled asset, whether to inline it, leave it
// external or hand it to the upload pipeline.  Decisions depend only on
// the record, the profile and the options, so deciding the same asset
// twice gives the same answer.
//
// Video and audio are always left external.  Everything else goes through
// an ordered list of rules; the first rule that matches decides:
//   vector-inline      vector images become inline markup.
//   upload-delegation  large, cacheable, single-use assets are uploaded.
//   size-inline        assets under their kind's threshold become data:
//                      URLs.  The threshold is scaled down when optimizing
//                      for modern transport.
//   critical-inline    critical assets up to twice the threshold are
//                      inlined too.
//   multi-use          shared assets stay external for caching.
//   default            everything else stays external.
class AssetDecider {
 public:
  // Estimated growth of inlined bytes from base64 encoding.
  static const double kBase64Overhead;

  static const char kMediaRule[];

  explicit AssetDecider(const EmbeddingOptions& options);
  ~AssetDecider();

  void Decide(const AssetRecord& record, const AssetProfile& profile,
              AssetDecision* decision) const;

  // Decides every profiled path that has a record.
  void DecideAll(const AssetRecordMap& records,
                 const AssetProfileMap& profiles,
                 AssetDecisionMap* decisions) const;

  // The rule list, for logging and tests.
  static int num_rules();
  static const char* rule_name(int index);

  // The upload location for path: upload_base_url, then the path
  // template with the file name substituted for {filename}, or appended
  // if the template has no placeholder.
  static GoogleString UploadUrl(const EmbeddingOptions& options,
                                const StringPiece& path);

  const EmbeddingOptions& options() const { return options_; }

 private:
  EmbeddingOptions options_;

  DISALLOW_COPY_AND_ASSIGN(AssetDecider);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_EMBEDDER_PUBLIC_ASSET_DECIDER_H_
