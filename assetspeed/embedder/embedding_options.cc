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


#include "assetspeed/embedder/public/embedding_options.h"

#include "base/logging.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

const char EmbeddingOptions::kInlineThreshold[] = "InlineThreshold";
const char EmbeddingOptions::kImageInlineThreshold[] = "ImageInlineThreshold";
const char EmbeddingOptions::kFontInlineThreshold[] = "FontInlineThreshold";
const char EmbeddingOptions::kModernTransportMultiplier[] =
    "ModernTransportMultiplier";
const char EmbeddingOptions::kEnableDataUriInlining[] =
    "EnableDataUriInlining";
const char EmbeddingOptions::kEnableVectorInlining[] = "EnableVectorInlining";
const char EmbeddingOptions::kOptimizeForModernTransport[] =
    "OptimizeForModernTransport";
const char EmbeddingOptions::kRespectCacheHints[] = "RespectCacheHints";
const char EmbeddingOptions::kEnableUploadDelegation[] =
    "EnableUploadDelegation";
const char EmbeddingOptions::kUploadBaseUrl[] = "UploadBaseUrl";
const char EmbeddingOptions::kUploadPathTemplate[] = "UploadPathTemplate";

const int64 EmbeddingOptions::kDefaultInlineThreshold;
const int64 EmbeddingOptions::kDefaultImageInlineThreshold;
const int64 EmbeddingOptions::kDefaultFontInlineThreshold;
const double EmbeddingOptions::kDefaultModernTransportMultiplier = 0.5;
const char EmbeddingOptions::kDefaultUploadPathTemplate[] =
    "/wp-content/uploads/";
const char EmbeddingOptions::kFilenamePlaceholder[] = "{filename}";

namespace {

// Multiplexed transports make extra requests cheap, so they get half the
// thresholds.
const int64 kMultiplexedInlineThreshold = 5120;
const int64 kMultiplexedImageInlineThreshold = 4096;
const int64 kMultiplexedFontInlineThreshold = 25000;

const char kMultiplexedReasoning[] =
    "HTTP/2 multiplexing reduces the cost of additional requests. "
    "Lower thresholds recommended.";
const char kSerialReasoning[] =
    "HTTP/1.1 has high request overhead. "
    "Higher thresholds recommended to reduce requests.";

EmbeddingOptions::OptionSettingResult ParseBool(StringPiece value, bool* out,
                                                GoogleString* msg) {
  TrimWhitespace(&value);
  if (StringCaseEqual(value, "on") || StringCaseEqual(value, "true") ||
      value == "1") {
    *out = true;
  } else if (StringCaseEqual(value, "off") ||
             StringCaseEqual(value, "false") || value == "0") {
    *out = false;
  } else {
    *msg = "must be one of true, false, on, off, 1 or 0";
    return EmbeddingOptions::kOptionValueInvalid;
  }
  return EmbeddingOptions::kOptionOk;
}

EmbeddingOptions::OptionSettingResult ParseThreshold(StringPiece value,
                                                     int64* out,
                                                     GoogleString* msg) {
  TrimWhitespace(&value);
  int64 parsed;
  if (!StringToInt64(value.as_string(), &parsed) || parsed < 0) {
    *msg = "must be a non-negative number of bytes";
    return EmbeddingOptions::kOptionValueInvalid;
  }
  *out = parsed;
  return EmbeddingOptions::kOptionOk;
}

const char* BoolToString(bool b) {
  return b ? "on" : "off";
}

}  // namespace

EmbeddingOptions::EmbeddingOptions()
    : inline_threshold(kDefaultInlineThreshold),
      image_inline_threshold(kDefaultImageInlineThreshold),
      font_inline_threshold(kDefaultFontInlineThreshold),
      modern_transport_multiplier(kDefaultModernTransportMultiplier),
      inline_data_uris(true),
      inline_vectors(true),
      optimize_for_modern_transport(false),
      respect_cache_hints(true),
      delegate_uploads(false),
      upload_path_template(kDefaultUploadPathTemplate) {
}

EmbeddingOptions EmbeddingOptions::ForTransport(bool multiplexed,
                                                GoogleString* reasoning) {
  EmbeddingOptions options;
  if (multiplexed) {
    options.inline_threshold = kMultiplexedInlineThreshold;
    options.image_inline_threshold = kMultiplexedImageInlineThreshold;
    options.font_inline_threshold = kMultiplexedFontInlineThreshold;
  }
  if (reasoning != NULL) {
    *reasoning = multiplexed ? kMultiplexedReasoning : kSerialReasoning;
  }
  return options;
}

EmbeddingOptions EmbeddingOptions::QuickPreset() {
  EmbeddingOptions options;
  options.optimize_for_modern_transport = true;
  options.inline_data_uris = true;
  options.inline_vectors = true;
  return options;
}

int64 EmbeddingOptions::ThresholdFor(MediaKind kind) const {
  switch (kind) {
    case kMediaImage:
      return image_inline_threshold;
    case kMediaFont:
      return font_inline_threshold;
    default:
      return inline_threshold;
  }
}

double EmbeddingOptions::EffectiveThresholdFor(MediaKind kind) const {
  double threshold = static_cast<double>(ThresholdFor(kind));
  if (optimize_for_modern_transport) {
    threshold *= modern_transport_multiplier;
  }
  return threshold;
}

EmbeddingOptions::OptionSettingResult EmbeddingOptions::SetOptionFromName(
    StringPiece name, StringPiece value, GoogleString* msg) {
  TrimWhitespace(&name);
  if (StringCaseEqual(name, kInlineThreshold)) {
    return ParseThreshold(value, &inline_threshold, msg);
  } else if (StringCaseEqual(name, kImageInlineThreshold)) {
    return ParseThreshold(value, &image_inline_threshold, msg);
  } else if (StringCaseEqual(name, kFontInlineThreshold)) {
    return ParseThreshold(value, &font_inline_threshold, msg);
  } else if (StringCaseEqual(name, kModernTransportMultiplier)) {
    double multiplier;
    TrimWhitespace(&value);
    if (!StringToDouble(value, &multiplier) ||
        multiplier <= 0.0 || multiplier > 1.0) {
      *msg = "must be a number greater than 0 and at most 1";
      return kOptionValueInvalid;
    }
    modern_transport_multiplier = multiplier;
    return kOptionOk;
  } else if (StringCaseEqual(name, kEnableDataUriInlining)) {
    return ParseBool(value, &inline_data_uris, msg);
  } else if (StringCaseEqual(name, kEnableVectorInlining)) {
    return ParseBool(value, &inline_vectors, msg);
  } else if (StringCaseEqual(name, kOptimizeForModernTransport)) {
    return ParseBool(value, &optimize_for_modern_transport, msg);
  } else if (StringCaseEqual(name, kRespectCacheHints)) {
    return ParseBool(value, &respect_cache_hints, msg);
  } else if (StringCaseEqual(name, kEnableUploadDelegation)) {
    return ParseBool(value, &delegate_uploads, msg);
  } else if (StringCaseEqual(name, kUploadBaseUrl)) {
    TrimWhitespace(&value);
    value.CopyToString(&upload_base_url);
    return kOptionOk;
  } else if (StringCaseEqual(name, kUploadPathTemplate)) {
    TrimWhitespace(&value);
    value.CopyToString(&upload_path_template);
    return kOptionOk;
  }
  return kOptionNameUnknown;
}

bool EmbeddingOptions::Merge(const StringStringMap& overrides,
                             GoogleString* msg) {
  for (StringStringMap::const_iterator p = overrides.begin(),
           e = overrides.end(); p != e; ++p) {
    GoogleString detail;
    switch (SetOptionFromName(p->first, p->second, &detail)) {
      case kOptionOk:
        break;
      case kOptionNameUnknown:
        *msg = StrCat("Unknown option ", p->first);
        return false;
      case kOptionValueInvalid:
        *msg = StrCat("Invalid value '", p->second, "' for ", p->first, ": ",
                      detail);
        return false;
    }
  }
  return true;
}

GoogleString EmbeddingOptions::ToString() const {
  GoogleString out = StringPrintf(
      "thresholds=%lld/%lld/%lld modern=%s(x%.2f) data_uris=%s vectors=%s "
      "cache_hints=%s delegate=%s",
      static_cast<long long>(inline_threshold),  // NOLINT
      static_cast<long long>(image_inline_threshold),  // NOLINT
      static_cast<long long>(font_inline_threshold),  // NOLINT
      BoolToString(optimize_for_modern_transport),
      modern_transport_multiplier,
      BoolToString(inline_data_uris), BoolToString(inline_vectors),
      BoolToString(respect_cache_hints), BoolToString(delegate_uploads));
  if (delegate_uploads) {
    StrAppend(&out, " upload=", upload_base_url, upload_path_template);
  }
  return out;
}

}  // namespace assetspeed
