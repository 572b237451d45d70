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

#ifndef ASSETSPEED_KERNEL_HTML_HTML_NAME_H_
#define ASSETSPEED_KERNEL_HTML_HTML_NAME_H_

#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

// HTML names are case insensitive.  However, in the parser, we keep
// the original parsed case of the name, in addition to the html
// keyword enumeration, if any.  Thus for both tags and attribute
// names, we have an enum representation which is used in filters
// for scanning, plus we have the original string representation.
class HtmlName {
 public:
  // We keep both attribute names and tag names in the same space
  // for convenience.  This list must be kept in alpha-order and
  // in sync with the static array in html_name.cc.
  //
  // Note that this list does not need to cover all HTML keywords --
  // only the ones that we are interested in for rewriting.
  enum Keyword {
    kAlt,
    kArea,
    kAudio,
    kBase,
    kBody,
    kBr,
    kClass,
    kCol,
    kDiv,
    kEmbed,
    kHead,
    kHeader,
    kHr,
    kHtml,
    kId,
    kImg,
    kInput,
    kLink,
    kMeta,
    kParam,
    kPicture,
    kPoster,
    kScript,
    kSource,
    kSrc,
    kStyle,
    kSvg,
    kTextarea,
    kTitle,
    kTrack,
    kVideo,
    kWbr,
    kXmp,

    // Note kNotAKeyword must be last in the enum.
    kNotAKeyword
  };

  // Constructs an HTML name given a keyword and the name's original
  // spelling.
  HtmlName(Keyword keyword, const StringPiece& str)
      : keyword_(keyword), value_(str.data(), str.size()) {}

  // Constructs an HTML name from its spelling, computing the keyword.
  explicit HtmlName(const StringPiece& str)
      : keyword_(Lookup(str)), value_(str.data(), str.size()) {}

  // Returns the keyword enumeration for this HTML Name.  Note that
  // keyword lookup is case-insensitive.
  Keyword keyword() const { return keyword_; }

  // Return the atomized, case-sensitive spelling of the name.
  const GoogleString& value() const { return value_; }

  // Canonical lower-case spelling of a keyword.
  static const char* KeywordToString(Keyword keyword);

  // Looks up a keyword, returning kNotAKeyword if not found.
  static Keyword Lookup(const StringPiece& name);

 private:
  Keyword keyword_;
  GoogleString value_;
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_HTML_HTML_NAME_H_
