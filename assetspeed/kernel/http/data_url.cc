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

#include "assetspeed/kernel/http/data_url.h"

#include "assetspeed/kernel/base/base64_util.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/http/content_type.h"

namespace assetspeed {

void DataUrl(const ContentType& content_type, const Encoding encoding,
             const StringPiece& content, GoogleString* result) {
  result->assign("data:");
  result->append(content_type.mime_type());
  switch (encoding) {
    case BASE64: {
      result->append(";base64,");
      GoogleString encoded;
      Mime64Encode(content, &encoded);
      result->append(encoded);
      break;
    }
    default: {
      // Either UNKNOWN or PLAIN.  No special encoding or alphabet.
      result->append(",");
      content.AppendToString(result);
      break;
    }
  }
}

bool IsDataUrl(StringPiece url) {
  TrimLeadingWhitespace(&url);
  return StringCaseStartsWith(url, "data:");
}

bool ParseDataUrl(const StringPiece& url, GoogleString* mime_type,
                  Encoding* encoding, StringPiece* encoded_content) {
  const char kData[] = "data:";
  const size_t kDataSize = STATIC_STRLEN(kData);
  const char kBase64[] = ";base64";
  // First invalidate all outputs.
  mime_type->clear();
  *encoding = UNKNOWN;
  encoded_content->clear();
  size_t header_boundary = url.find(',');
  if ((header_boundary == StringPiece::npos) ||
      !StringCaseStartsWith(url, kData)) {
    return false;
  }
  StringPiece header(url.data(), header_boundary);
  size_t mime_boundary = header.find(';');
  if (mime_boundary == StringPiece::npos) {
    // no charset or base64 encoding.
    mime_boundary = header_boundary;
    *encoding = PLAIN;
  } else if (StringCaseEndsWith(header, kBase64)) {
    *encoding = BASE64;
  } else {
    *encoding = PLAIN;
  }
  url.substr(kDataSize, mime_boundary - kDataSize).CopyToString(mime_type);
  *encoded_content = url.substr(header_boundary + 1);
  return true;
}

bool DecodeDataUrlContent(Encoding encoding,
                          const StringPiece& encoded_content,
                          GoogleString* decoded_content) {
  switch (encoding) {
    case PLAIN:
      // No change, just copy data.
      encoded_content.CopyToString(decoded_content);
      return true;
    case BASE64:
      return Mime64Decode(encoded_content, decoded_content);
    default:
      return false;
  }
}

}  // namespace assetspeed
