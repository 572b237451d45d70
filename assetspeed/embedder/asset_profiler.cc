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


#include "assetspeed/embedder/public/asset_profiler.h"

#include <utility>

#include "base/logging.h"
#include "assetspeed/kernel/base/message_handler.h"
#include "assetspeed/kernel/html/html_element.h"
#include "assetspeed/kernel/html/html_name.h"
#include "assetspeed/kernel/http/content_type.h"

namespace assetspeed {

const int AssetProfiler::kCriticalImageCount = 5;

namespace {

// Class tokens marking above-the-fold layout regions.
const char kCriticalClassPattern[] =
    "(^|\\s)(hero|banner)(\\s|$)|above-fold";

// Cut-offs for the preliminary classification.
const int64 kSmallAssetSize = 10240;
const int64 kCriticalAssetSize = 20480;
const int64 kLargeAssetSize = 50000;

}  // namespace

AssetProfiler::AssetProfiler(MessageHandler* handler)
    : handler_(handler),
      critical_class_pattern_(kCriticalClassPattern) {
  DCHECK(critical_class_pattern_.ok()) << critical_class_pattern_.error();
}

AssetProfiler::~AssetProfiler() {
}

bool AssetProfiler::IsInCriticalRegion(const HtmlElement* element) const {
  for (; element != NULL; element = element->parent()) {
    if (element->keyword() == HtmlName::kHeader) {
      return true;
    }
    const char* classes = element->AttributeValue(HtmlName::kClass);
    if (classes != NULL &&
        RE2::PartialMatch(classes, critical_class_pattern_)) {
      return true;
    }
  }
  return false;
}

int AssetProfiler::Profile(const AssetReferenceVector& references,
                           const AssetContentMap& contents,
                           AssetRecordMap* records,
                           AssetProfileMap* profiles) {
  StringSet missing;
  StringSet first_images;
  int image_ordinal = 0;
  for (int i = 0, n = references.size(); i < n; ++i) {
    const AssetReference& reference = references[i];
    bool is_image_element =
        (reference.context == AssetReference::kImageSource);
    int ordinal = is_image_element ? image_ordinal++ : -1;

    AssetContentMap::const_iterator content = contents.find(reference.path);
    if (content == contents.end()) {
      if (missing.insert(reference.path).second) {
        handler_->Message(kInfo, "No contents for %s referenced from %s; "
                          "leaving it untouched", reference.path.c_str(),
                          reference.LocationString().c_str());
      }
      continue;
    }

    std::pair<AssetProfileMap::iterator, bool> inserted =
        profiles->insert(AssetProfileMap::value_type(reference.path,
                                                     AssetProfile()));
    AssetProfile& profile = inserted.first->second;
    AssetRecord* record = &(*records)[reference.path];
    if (inserted.second) {
      *record = AssetRecord(reference.path, content->second);
      profile.path = reference.path;
      profile.kind = record->kind;
      profile.size = record->size();
      profile.cacheable = (record->content_type != NULL &&
                           record->content_type->IsLongCacheable());
    }
    // Font URLs often carry no recognizable extension; any @font-face
    // reference to such a path makes it a font.
    if (record->kind == kMediaOther &&
        reference.context == AssetReference::kFontFace) {
      record->kind = kMediaFont;
      profile.kind = kMediaFont;
    }
    ++profile.usage_count;

    // Only the first <img> reference to a path decides whether it is
    // critical.  References from CSS or media elements never do.
    if (is_image_element && first_images.insert(reference.path).second) {
      profile.critical = (ordinal < kCriticalImageCount ||
                          IsInCriticalRegion(reference.element));
    }
  }

  for (AssetProfileMap::iterator p = profiles->begin(), e = profiles->end();
       p != e; ++p) {
    Classify(&p->second);
  }
  return missing.size();
}

void AssetProfiler::Classify(AssetProfile* profile) {
  if (profile->kind == kMediaVideo || profile->kind == kMediaAudio) {
    profile->recommended_action = kPreliminaryExternal;
    profile->recommended_reason = "Media files are too large";
  } else if (profile->size < kSmallAssetSize && profile->usage_count == 1) {
    profile->recommended_action = kPreliminaryInline;
    profile->recommended_reason = "Small, single-use asset";
  } else if (profile->critical && profile->size < kCriticalAssetSize) {
    profile->recommended_action = kPreliminaryInline;
    profile->recommended_reason = "Critical for LCP";
  } else if (profile->usage_count > 1) {
    profile->recommended_action = kPreliminaryExternal;
    profile->recommended_reason = "Reused multiple times";
  } else if (profile->size > kLargeAssetSize && profile->cacheable) {
    profile->recommended_action = kPreliminaryUpload;
    profile->recommended_reason = "Large, cacheable asset";
  } else {
    profile->recommended_action = kPreliminaryExternal;
    profile->recommended_reason = "Default strategy";
  }
}

void AssetProfiler::Summarize(const AssetProfileMap& profiles,
                              AssetSummary* summary) {
  *summary = AssetSummary();
  for (AssetProfileMap::const_iterator p = profiles.begin(),
           e = profiles.end(); p != e; ++p) {
    const AssetProfile& profile = p->second;
    ++summary->total_assets;
    summary->total_size += profile.size;
    ++summary->count_by_kind[MediaKindName(profile.kind)];
    summary->usage_counts[profile.path] = profile.usage_count;
    if (profile.critical) {
      summary->critical_paths.push_back(profile.path);
    }
  }
  if (summary->total_assets > 0) {
    summary->average_size = summary->total_size / summary->total_assets;
  }
}

}  // namespace assetspeed
