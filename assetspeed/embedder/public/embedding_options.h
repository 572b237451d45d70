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


#ifndef ASSETSPEED_EMBEDDER_PUBLIC_EMBEDDING_OPTIONS_H_
#define ASSETSPEED_EMBEDDER_PUBLIC_EMBEDDING_OPTIONS_H_

#include "assetspeed/embedder/public/asset_types.h"
#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

// Thresholds and switches controlling the embedding decisions.  This is a
// plain value: every stage takes its own copy, and nothing changes it in
// the middle of a pass.
struct EmbeddingOptions {
  enum OptionSettingResult {
    kOptionOk,
    kOptionNameUnknown,
    kOptionValueInvalid
  };

  // Names accepted by SetOptionFromName.
  static const char kInlineThreshold[];
  static const char kImageInlineThreshold[];
  static const char kFontInlineThreshold[];
  static const char kModernTransportMultiplier[];
  static const char kEnableDataUriInlining[];
  static const char kEnableVectorInlining[];
  static const char kOptimizeForModernTransport[];
  static const char kRespectCacheHints[];
  static const char kEnableUploadDelegation[];
  static const char kUploadBaseUrl[];
  static const char kUploadPathTemplate[];

  static const int64 kDefaultInlineThreshold = 10240;
  static const int64 kDefaultImageInlineThreshold = 8192;
  static const int64 kDefaultFontInlineThreshold = 50000;
  static const double kDefaultModernTransportMultiplier;
  static const char kDefaultUploadPathTemplate[];
  // Replaced by the asset's file name in upload_path_template.
  static const char kFilenamePlaceholder[];

  EmbeddingOptions();

  // Thresholds suited to the transport the page will be served over,
  // with a one-line explanation in *reasoning (which may be NULL).
  static EmbeddingOptions ForTransport(bool multiplexed,
                                       GoogleString* reasoning);

  // Defaults tuned for a quick single-page run: modern transport with
  // data: URL and vector inlining.
  static EmbeddingOptions QuickPreset();

  // The inline threshold for a media kind: images and fonts have their
  // own, everything else uses the generic one.
  int64 ThresholdFor(MediaKind kind) const;

  // ThresholdFor(kind), scaled down when optimizing for modern transport.
  double EffectiveThresholdFor(MediaKind kind) const;

  bool has_upload_target() const { return !upload_base_url.empty(); }

  // Sets the named option (case-insensitive) from its string form.  On
  // kOptionValueInvalid, *msg says what was wrong with value.
  OptionSettingResult SetOptionFromName(StringPiece name, StringPiece value,
                                        GoogleString* msg);

  // Applies name/value overrides on top of these options.  Stops at the
  // first failure, describing it in *msg.
  bool Merge(const StringStringMap& overrides, GoogleString* msg);

  // One-line summary for log messages.
  GoogleString ToString() const;

  int64 inline_threshold;
  int64 image_inline_threshold;
  int64 font_inline_threshold;
  double modern_transport_multiplier;

  bool inline_data_uris;
  bool inline_vectors;
  bool optimize_for_modern_transport;
  bool respect_cache_hints;
  bool delegate_uploads;

  // Upload target used when delegating.  Delegation never happens without
  // a base url.
  GoogleString upload_base_url;
  GoogleString upload_path_template;
};

}  // namespace assetspeed

#endif  // ASSETSPEED_EMBEDDER_PUBLIC_EMBEDDING_OPTIONS_H_
