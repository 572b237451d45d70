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

#include "assetspeed/kernel/html/html_name.h"

#include <algorithm>

#include "base/logging.h"
#include "assetspeed/kernel/base/basictypes.h"

namespace assetspeed {

namespace {

// Must be in alpha order, matching HtmlName::Keyword.
const char* const kKeywordNames[] = {
  "alt",
  "area",
  "audio",
  "base",
  "body",
  "br",
  "class",
  "col",
  "div",
  "embed",
  "head",
  "header",
  "hr",
  "html",
  "id",
  "img",
  "input",
  "link",
  "meta",
  "param",
  "picture",
  "poster",
  "script",
  "source",
  "src",
  "style",
  "svg",
  "textarea",
  "title",
  "track",
  "video",
  "wbr",
  "xmp",
};

// Compares a table entry against a lookup key, case-insensitively.  Table
// entries are all lower-case.
struct KeywordLess {
  bool operator()(const char* entry, const GoogleString& key) const {
    return StringPiece(entry) < StringPiece(key);
  }
};

}  // namespace

const char* HtmlName::KeywordToString(Keyword keyword) {
  static_assert(arraysize(kKeywordNames) == kNotAKeyword,
                "keyword table out of sync");
  DCHECK(keyword < kNotAKeyword);
  return kKeywordNames[keyword];
}

HtmlName::Keyword HtmlName::Lookup(const StringPiece& name) {
  GoogleString lower(name.data(), name.size());
  LowerString(&lower);
  const char* const* end = kKeywordNames + arraysize(kKeywordNames);
  const char* const* p =
      std::lower_bound(kKeywordNames, end, lower, KeywordLess());
  if ((p != end) && (lower == *p)) {
    return static_cast<Keyword>(p - kKeywordNames);
  }
  return kNotAKeyword;
}

}  // namespace assetspeed
