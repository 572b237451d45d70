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

// A collection of asset content-types and their attributes.

#ifndef ASSETSPEED_KERNEL_HTTP_CONTENT_TYPE_H_
#define ASSETSPEED_KERNEL_HTTP_CONTENT_TYPE_H_

#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

struct ContentType {
 public:
  // The asset types we recognize by file extension.
  enum Type {
    kJpeg,
    kPng,
    kGif,
    kWebp,
    kSvg,
    kBmp,
    kIco,
    kWoff,
    kWoff2,
    kTtf,
    kEot,
    kOtf,
    kVideo,
    kAudio,
    kOctetStream,  // Unknown binary resources.
  };

  const char* mime_type() const { return mime_type_; }
  const char* file_extension() const { return file_extension_; }
  Type type() const { return type_; }

  // Return true iff this content type is a raster or vector image.
  bool IsImage() const;
  // Return true iff this content type is a scalable vector format, whose
  // bytes are markup that can be placed directly into a document.
  bool IsVector() const;
  // Return true iff this content type is a web font.
  bool IsFont() const;
  // Return true iff this content type is Video.
  bool IsVideo() const;
  // Return true iff this content type is Audio.
  bool IsAudio() const;

  // True if the extension is one that is conventionally served with a
  // far-future cache lifetime.
  bool IsLongCacheable() const { return long_cacheable_; }

  // These fields should be private; we leave them public only so we can use
  // struct literals in content_type.cc.  Other code should use the above
  // accessor methods instead of accessing these fields directly.
  const char* mime_type_;
  const char* file_extension_;  // includes ".", e.g. ".ext"
  Type type_;
  bool long_cacheable_;
};

extern const ContentType& kContentTypeJpeg;
extern const ContentType& kContentTypePng;
extern const ContentType& kContentTypeGif;
extern const ContentType& kContentTypeSvg;
extern const ContentType& kContentTypeWoff2;
extern const ContentType& kContentTypeBinaryOctetStream;

// Given a name (file or url), see if it has the canonical extension
// corresponding to a particular content type.  Any query or fragment is
// ignored.  Returns NULL if the extension is not recognized.
const ContentType* NameExtensionToContentType(const StringPiece& name);

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_HTTP_CONTENT_TYPE_H_
