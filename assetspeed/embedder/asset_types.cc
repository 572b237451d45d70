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


#include "assetspeed/embedder/public/asset_types.h"

#include "base/logging.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/html/html_element.h"
#include "assetspeed/kernel/http/content_type.h"

namespace assetspeed {

const char* MediaKindName(MediaKind kind) {
  switch (kind) {
    case kMediaImage: return "image";
    case kMediaFont:  return "font";
    case kMediaVideo: return "video";
    case kMediaAudio: return "audio";
    case kMediaOther: return "other";
  }
  LOG(DFATAL) << "Unknown media kind " << static_cast<int>(kind);
  return "other";
}

MediaKind MediaKindForContentType(const ContentType* content_type) {
  if (content_type == NULL) {
    return kMediaOther;
  } else if (content_type->IsImage()) {
    return kMediaImage;
  } else if (content_type->IsFont()) {
    return kMediaFont;
  } else if (content_type->IsVideo()) {
    return kMediaVideo;
  } else if (content_type->IsAudio()) {
    return kMediaAudio;
  }
  return kMediaOther;
}

const char* PreliminaryActionName(PreliminaryAction action) {
  switch (action) {
    case kPreliminaryInline:   return "inline";
    case kPreliminaryExternal: return "external";
    case kPreliminaryUpload:   return "upload";
  }
  LOG(DFATAL) << "Unknown preliminary action " << static_cast<int>(action);
  return "external";
}

const char* DecisionKindName(DecisionKind kind) {
  switch (kind) {
    case kInlineData:     return "inline-data";
    case kInlineText:     return "inline-text";
    case kExternalize:    return "externalize";
    case kDelegateUpload: return "delegate-upload";
  }
  LOG(DFATAL) << "Unknown decision kind " << static_cast<int>(kind);
  return "externalize";
}

GoogleString AssetReference::LocationString() const {
  GoogleString tag = (element == NULL) ? GoogleString("?") : element->name_str();
  switch (context) {
    case kImageSource:
    case kMediaSource:
      return StrCat("<", tag, " src>");
    case kStyleAttribute:
      return StrCat("<", tag, " style>");
    case kStyleBlock:
      return "<style> block";
    case kFontFace:
      return "@font-face rule";
  }
  return "unknown";
}

AssetRecord::AssetRecord(const StringPiece& asset_path,
                         const StringPiece& asset_contents)
    : contents(asset_contents),
      content_type(NameExtensionToContentType(asset_path)),
      kind(MediaKindForContentType(content_type)) {
  asset_path.CopyToString(&path);
}

}  // namespace assetspeed
