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

#ifndef ASSETSPEED_KERNEL_HTTP_DATA_URL_H_
#define ASSETSPEED_KERNEL_HTTP_DATA_URL_H_

#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

struct ContentType;

enum Encoding {
  UNKNOWN,  // Used only for output of ParseDataUrl.
  BASE64,
  PLAIN
};

// Create a data: url from the given content-type and content.  See:
// http://en.wikipedia.org/wiki/Data_URI_scheme
//
// The ENCODING indicates how to encode the content; for binary data
// this is BASE64.  Note that it is the caller's responsibility to ensure
// that PLAIN content does not contain characters that need escaping.
void DataUrl(const ContentType& content_type, const Encoding encoding,
             const StringPiece& content, GoogleString* result);

// Returns true if url is a data: url (case-insensitive scheme match).
bool IsDataUrl(StringPiece url);

// Splits a data: url into its mime type, encoding and still-encoded
// payload.  Returns false if url is not a well-formed data: url.
bool ParseDataUrl(const StringPiece& url, GoogleString* mime_type,
                  Encoding* encoding, StringPiece* encoded_content);

bool DecodeDataUrlContent(Encoding encoding,
                          const StringPiece& encoded_content,
                          GoogleString* decoded_content);

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_HTTP_DATA_URL_H_
