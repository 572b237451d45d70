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

// Value types shared by the stages of the embedding pipeline: where an
// asset is referenced, what bytes back it, what we learned about it, and
// what we decided to do with it.

#ifndef ASSETSPEED_EMBEDDER_PUBLIC_ASSET_TYPES_H_
#define ASSETSPEED_EMBEDDER_PUBLIC_ASSET_TYPES_H_

#include <map>
#include <vector>

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

class HtmlCharactersNode;
class HtmlElement;
struct ContentType;

enum MediaKind {
  kMediaImage,
  kMediaFont,
  kMediaVideo,
  kMediaAudio,
  kMediaOther,
};

const char* MediaKindName(MediaKind kind);

// Maps a recognized content type to its media kind.  NULL maps to
// kMediaOther.
MediaKind MediaKindForContentType(const ContentType* content_type);

// One occurrence of an asset URL inside a document.  References point into
// the parse tree they were extracted from and are only valid while that
// tree is alive.
struct AssetReference {
  enum Context {
    kImageSource,     // <img src>
    kMediaSource,     // <video src>, <audio src>, <source src>
    kStyleAttribute,  // url() inside a style="" attribute
    kStyleBlock,      // url() inside a <style> body
    kFontFace,        // url() inside an @font-face rule of a <style> body
  };

  AssetReference()
      : context(kImageSource), element(NULL), characters(NULL) {}

  // Returns a human-readable description of where this reference occurs,
  // for use in log messages.
  GoogleString LocationString() const;

  bool is_css() const { return context >= kStyleAttribute; }

  Context context;
  // The element whose attribute holds the URL, or the <style> element for
  // style-block references.
  HtmlElement* element;
  // The body of the <style> element for style-block references, else NULL.
  HtmlCharactersNode* characters;
  GoogleString path;
};

typedef std::vector<AssetReference> AssetReferenceVector;

// The caller-supplied bytes for each asset path.  The embedder holds views
// only; the caller keeps the buffers alive for the duration of a pass.
typedef std::map<GoogleString, StringPiece> AssetContentMap;

// The bytes backing one path, with the attributes derived from its name.
struct AssetRecord {
  AssetRecord() : content_type(NULL), kind(kMediaOther) {}
  AssetRecord(const StringPiece& asset_path, const StringPiece& asset_contents);

  int64 size() const { return contents.size(); }

  GoogleString path;
  StringPiece contents;
  // NULL when the extension is not recognized.
  const ContentType* content_type;
  MediaKind kind;
};

typedef std::map<GoogleString, AssetRecord> AssetRecordMap;

// Coarse recommendation computed while profiling.  The final decision is
// made separately by the AssetDecider.
enum PreliminaryAction {
  kPreliminaryInline,
  kPreliminaryExternal,
  kPreliminaryUpload,
};

const char* PreliminaryActionName(PreliminaryAction action);

struct AssetProfile {
  AssetProfile()
      : kind(kMediaOther), size(0), usage_count(0), critical(false),
        cacheable(false), recommended_action(kPreliminaryExternal) {}

  GoogleString path;
  MediaKind kind;
  int64 size;
  int usage_count;
  bool critical;
  bool cacheable;
  PreliminaryAction recommended_action;
  GoogleString recommended_reason;
};

typedef std::map<GoogleString, AssetProfile> AssetProfileMap;

enum DecisionKind {
  kInlineData,  // Reference replaced by a base64 data: URL.
  kInlineText,  // Referencing element replaced by the asset's markup.
  kExternalize,
  kDelegateUpload,
};

const char* DecisionKindName(DecisionKind kind);

struct AssetDecision {
  AssetDecision()
      : kind(kExternalize), media_kind(kMediaOther), original_size(0),
        critical(false), requests_saved(0), byte_delta(0) {}

  GoogleString path;
  DecisionKind kind;
  MediaKind media_kind;
  int64 original_size;
  bool critical;

  // The data: URL or markup for the inline kinds.
  GoogleString payload;
  // The synthesized location for kDelegateUpload.
  GoogleString target_url;

  // Estimated savings: requests avoided and the change in document bytes.
  int requests_saved;
  int64 byte_delta;

  StringVector warnings;
  GoogleString reason;
  // Name of the rule that produced this decision.
  GoogleString rule;
};

typedef std::map<GoogleString, AssetDecision> AssetDecisionMap;

}  // namespace assetspeed

#endif  // ASSETSPEED_EMBEDDER_PUBLIC_ASSET_TYPES_H_
