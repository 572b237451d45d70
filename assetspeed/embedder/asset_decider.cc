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


#include "assetspeed/embedder/public/asset_decider.h"

#include "base/logging.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/http/content_type.h"
#include "assetspeed/kernel/http/data_url.h"

namespace assetspeed {

const double AssetDecider::kBase64Overhead = 0.37;
const char AssetDecider::kMediaRule[] = "media";

namespace {

const char kMediaReason[] = "media files are too large to inline";
const char kMediaWarning[] = "Consider using a video streaming service";

typedef bool (*RulePredicate)(const AssetRecord& record,
                              const AssetProfile& profile,
                              const EmbeddingOptions& options);
typedef void (*RuleAction)(const AssetRecord& record,
                           const AssetProfile& profile,
                           const EmbeddingOptions& options,
                           AssetDecision* decision);

struct Rule {
  const char* name;
  RulePredicate matches;
  RuleAction apply;
};

void SetInlineData(const AssetRecord& record, AssetDecision* decision) {
  const ContentType& type = (record.content_type != NULL) ?
      *record.content_type : kContentTypeBinaryOctetStream;
  decision->kind = kInlineData;
  DataUrl(type, BASE64, record.contents, &decision->payload);
  decision->requests_saved = 1;
  decision->byte_delta = static_cast<int64>(
      record.size() * AssetDecider::kBase64Overhead);
}

bool IsVector(const AssetRecord& record, const AssetProfile& profile,
              const EmbeddingOptions& options) {
  return options.inline_vectors && record.content_type != NULL &&
      record.content_type->IsVector();
}

void InlineVector(const AssetRecord& record, const AssetProfile& profile,
                  const EmbeddingOptions& options, AssetDecision* decision) {
  decision->kind = kInlineText;
  record.contents.CopyToString(&decision->payload);
  decision->requests_saved = 1;
  decision->byte_delta = 0;
  decision->reason = "vector formats benefit from inlining for manipulation";
}

bool ShouldDelegate(const AssetRecord& record, const AssetProfile& profile,
                    const EmbeddingOptions& options) {
  return options.delegate_uploads && options.has_upload_target() &&
      profile.size > options.ThresholdFor(profile.kind) &&
      (profile.cacheable || !options.respect_cache_hints) &&
      profile.usage_count == 1;
}

void Delegate(const AssetRecord& record, const AssetProfile& profile,
              const EmbeddingOptions& options, AssetDecision* decision) {
  decision->kind = kDelegateUpload;
  decision->target_url = AssetDecider::UploadUrl(options, record.path);
  decision->reason = "large single-use asset routed to managed storage";
}

bool FitsInlineThreshold(const AssetRecord& record,
                         const AssetProfile& profile,
                         const EmbeddingOptions& options) {
  if (!options.inline_data_uris ||
      profile.size > options.ThresholdFor(profile.kind)) {
    return false;
  }
  // Within the nominal threshold; modern transport may still rule it out.
  return profile.size <= options.EffectiveThresholdFor(profile.kind);
}

void InlineSmall(const AssetRecord& record, const AssetProfile& profile,
                 const EmbeddingOptions& options, AssetDecision* decision) {
  SetInlineData(record, decision);
  decision->reason = StrCat("small asset (", Integer64ToString(profile.size),
                            " bytes) inlined to save an HTTP request");
}

bool IsSmallCritical(const AssetRecord& record, const AssetProfile& profile,
                     const EmbeddingOptions& options) {
  // size <= 2 * threshold, without overflowing for very large thresholds.
  int64 threshold = options.ThresholdFor(profile.kind);
  return profile.critical && options.inline_data_uris &&
      profile.size - threshold <= threshold;
}

void InlineCritical(const AssetRecord& record, const AssetProfile& profile,
                    const EmbeddingOptions& options,
                    AssetDecision* decision) {
  SetInlineData(record, decision);
  decision->reason = "critical above-the-fold asset inlined for faster paint";
  double threshold = options.EffectiveThresholdFor(profile.kind);
  if (profile.size > threshold) {
    // threshold < size here, so it fits in an int64.
    decision->warnings.push_back(
        StrCat("Asset is ", FormatBytes(profile.size),
               ", larger than the inline threshold of ",
               FormatBytes(static_cast<int64>(threshold))));
  }
}

bool IsShared(const AssetRecord& record, const AssetProfile& profile,
              const EmbeddingOptions& options) {
  return profile.usage_count > 1;
}

void KeepShared(const AssetRecord& record, const AssetProfile& profile,
                const EmbeddingOptions& options, AssetDecision* decision) {
  decision->kind = kExternalize;
  decision->reason = StrCat("used ", IntegerToString(profile.usage_count),
                            " times; a shared external file benefits from "
                            "caching");
}

bool Always(const AssetRecord& record, const AssetProfile& profile,
            const EmbeddingOptions& options) {
  return true;
}

void KeepExternal(const AssetRecord& record, const AssetProfile& profile,
                  const EmbeddingOptions& options, AssetDecision* decision) {
  decision->kind = kExternalize;
  decision->reason = StrCat("size of ", Integer64ToString(profile.size),
                            " bytes exceeds every inline threshold");
}

// Evaluated in order; the first match wins.
const Rule kRules[] = {
  { "vector-inline", IsVector, InlineVector },
  { "upload-delegation", ShouldDelegate, Delegate },
  { "size-inline", FitsInlineThreshold, InlineSmall },
  { "critical-inline", IsSmallCritical, InlineCritical },
  { "multi-use", IsShared, KeepShared },
  { "default", Always, KeepExternal },
};

}  // namespace

AssetDecider::AssetDecider(const EmbeddingOptions& options)
    : options_(options) {
}

AssetDecider::~AssetDecider() {
}

int AssetDecider::num_rules() {
  return arraysize(kRules);
}

const char* AssetDecider::rule_name(int index) {
  DCHECK_LE(0, index);
  DCHECK_LT(index, num_rules());
  return kRules[index].name;
}

GoogleString AssetDecider::UploadUrl(const EmbeddingOptions& options,
                                     const StringPiece& path) {
  StringPiece filename(path);
  size_t end = filename.find_first_of("?#");
  if (end != StringPiece::npos) {
    filename = filename.substr(0, end);
  }
  size_t slash = filename.rfind('/');
  if (slash != StringPiece::npos && slash + 1 < filename.size()) {
    filename = filename.substr(slash + 1);
  }

  GoogleString location = options.upload_path_template;
  if (GlobalReplaceSubstring(EmbeddingOptions::kFilenamePlaceholder, filename,
                             &location) == 0) {
    StrAppend(&location, filename);
  }
  return StrCat(options.upload_base_url, location);
}

void AssetDecider::Decide(const AssetRecord& record,
                          const AssetProfile& profile,
                          AssetDecision* decision) const {
  *decision = AssetDecision();
  decision->path = profile.path;
  decision->media_kind = profile.kind;
  decision->original_size = profile.size;
  decision->critical = profile.critical;

  if (profile.kind == kMediaVideo || profile.kind == kMediaAudio) {
    decision->kind = kExternalize;
    decision->rule = kMediaRule;
    decision->reason = kMediaReason;
    decision->warnings.push_back(kMediaWarning);
    return;
  }

  for (int i = 0, n = arraysize(kRules); i < n; ++i) {
    const Rule& rule = kRules[i];
    if (rule.matches(record, profile, options_)) {
      decision->rule = rule.name;
      rule.apply(record, profile, options_, decision);
      return;
    }
  }
  LOG(DFATAL) << "No rule matched " << profile.path;
}

void AssetDecider::DecideAll(const AssetRecordMap& records,
                             const AssetProfileMap& profiles,
                             AssetDecisionMap* decisions) const {
  for (AssetProfileMap::const_iterator p = profiles.begin(),
           e = profiles.end(); p != e; ++p) {
    AssetRecordMap::const_iterator record = records.find(p->first);
    if (record == records.end()) {
      LOG(DFATAL) << "Profile without a record: " << p->first;
      continue;
    }
    Decide(record->second, p->second, &(*decisions)[p->first]);
  }
}

}  // namespace assetspeed
