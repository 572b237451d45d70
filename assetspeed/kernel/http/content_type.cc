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

#include "assetspeed/kernel/http/content_type.h"

#include "base/logging.h"
#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

namespace {

// Lookup is by first match, so an extension shared by video and audio
// (".ogg") resolves to video.
const ContentType kTypes[] = {
  // Canonical types, referenced by index below.
  {"image/jpeg",                    ".jpg",   ContentType::kJpeg,  true},
  {"image/png",                     ".png",   ContentType::kPng,   true},
  {"image/gif",                     ".gif",   ContentType::kGif,   true},
  {"image/svg+xml",                 ".svg",   ContentType::kSvg,   true},
  {"font/woff2",                    ".woff2", ContentType::kWoff2, true},
  {"application/octet-stream",      ".bin",   ContentType::kOctetStream,
   false},

  // Synonyms and the rest of the table are not index-sensitive.
  {"image/jpeg",                    ".jpeg",  ContentType::kJpeg,  true},
  {"image/webp",                    ".webp",  ContentType::kWebp,  true},
  {"image/bmp",                     ".bmp",   ContentType::kBmp,   false},
  {"image/x-icon",                  ".ico",   ContentType::kIco,   false},

  {"font/woff",                     ".woff",  ContentType::kWoff,  true},
  {"font/ttf",                      ".ttf",   ContentType::kTtf,   true},
  {"application/vnd.ms-fontobject", ".eot",   ContentType::kEot,   true},
  {"font/otf",                      ".otf",   ContentType::kOtf,   false},

  {"video/mp4",                     ".mp4",   ContentType::kVideo, true},
  {"video/webm",                    ".webm",  ContentType::kVideo, true},
  {"video/ogg",                     ".ogg",   ContentType::kVideo, false},
  {"video/quicktime",               ".mov",   ContentType::kVideo, false},

  {"audio/mpeg",                    ".mp3",   ContentType::kAudio, true},
  {"audio/wav",                     ".wav",   ContentType::kAudio, false},
  {"audio/mp4",                     ".m4a",   ContentType::kAudio, false},
};
const int kNumTypes = arraysize(kTypes);

}  // namespace

const ContentType& kContentTypeJpeg = kTypes[0];
const ContentType& kContentTypePng = kTypes[1];
const ContentType& kContentTypeGif = kTypes[2];
const ContentType& kContentTypeSvg = kTypes[3];
const ContentType& kContentTypeWoff2 = kTypes[4];
const ContentType& kContentTypeBinaryOctetStream = kTypes[5];

bool ContentType::IsImage() const {
  switch (type_) {
    case kJpeg:
    case kPng:
    case kGif:
    case kWebp:
    case kSvg:
    case kBmp:
    case kIco:
      return true;
    default:
      return false;
  }
}

bool ContentType::IsVector() const {
  return type_ == kSvg;
}

bool ContentType::IsFont() const {
  switch (type_) {
    case kWoff:
    case kWoff2:
    case kTtf:
    case kEot:
    case kOtf:
      return true;
    default:
      return false;
  }
}

bool ContentType::IsVideo() const {
  return type_ == kVideo;
}

bool ContentType::IsAudio() const {
  return type_ == kAudio;
}

const ContentType* NameExtensionToContentType(const StringPiece& name) {
  StringPiece path(name);
  StringPiece::size_type query_pos = path.find_first_of("?#");
  if (query_pos != StringPiece::npos) {
    path = path.substr(0, query_pos);
  }
  // Get the name from the extension.  A dot inside a directory name is not
  // an extension.
  StringPiece::size_type ext_pos = path.rfind('.');
  StringPiece::size_type slash_pos = path.rfind('/');
  if ((ext_pos != StringPiece::npos) &&
      ((slash_pos == StringPiece::npos) || (ext_pos > slash_pos))) {
    StringPiece ext = path.substr(ext_pos);
    for (int i = 0; i < kNumTypes; ++i) {
      if (StringCaseEqual(ext, kTypes[i].file_extension())) {
        return &kTypes[i];
      }
    }
  }
  return NULL;
}

}  // namespace assetspeed
