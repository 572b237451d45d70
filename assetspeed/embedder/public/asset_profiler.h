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


#ifndef ASSETSPEED_EMBEDDER_PUBLIC_ASSET_PROFILER_H_
#define ASSETSPEED_EMBEDDER_PUBLIC_ASSET_PROFILER_H_

#include "assetspeed/embedder/public/asset_types.h"
#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "re2/re2.h"

namespace assetspeed {

class HtmlElement;
class MessageHandler;

// Aggregate view over a set of profiles, for analysis without rewriting.
struct AssetSummary {
  AssetSummary() : total_assets(0), total_size(0), average_size(0) {}

  int total_assets;
  int64 total_size;
  int64 average_size;
  // Keyed by MediaKindName.
  StringIntMap count_by_kind;
  StringIntMap usage_counts;
  // In path order.
  StringVector critical_paths;
};

// Turns the references found in a document, plus the bytes the caller
// fetched, into one profile per distinct path.  Paths referenced without
// bytes, and bytes that are never referenced, get no profile.
class AssetProfiler {
 public:
  // The first this-many <img> references in document order are treated
  // as above the fold.
  static const int kCriticalImageCount;

  explicit AssetProfiler(MessageHandler* handler);
  ~AssetProfiler();

  // Fills records and profiles, keyed by path, for every path with at
  // least one reference and an entry in contents.  Returns the number of
  // distinct referenced paths that had no contents.
  int Profile(const AssetReferenceVector& references,
              const AssetContentMap& contents,
              AssetRecordMap* records,
              AssetProfileMap* profiles);

  // True if element, or one of its ancestors, is a <header> or carries a
  // hero, banner or above-fold class.
  bool IsInCriticalRegion(const HtmlElement* element) const;

  // Sets the preliminary recommendation on a profile whose other fields
  // are filled in.
  static void Classify(AssetProfile* profile);

  static void Summarize(const AssetProfileMap& profiles,
                        AssetSummary* summary);

 private:
  MessageHandler* handler_;
  RE2 critical_class_pattern_;

  DISALLOW_COPY_AND_ASSIGN(AssetProfiler);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_EMBEDDER_PUBLIC_ASSET_PROFILER_H_
