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

#ifndef ASSETSPEED_KERNEL_HTML_HTML_KEYWORDS_H_
#define ASSETSPEED_KERNEL_HTML_HTML_KEYWORDS_H_

#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/html/html_name.h"

namespace assetspeed {

// Entity escaping plus the structural facts about tags the lexer needs.
class HtmlKeywords {
 public:
  // Take a raw text string and escape it so it can be used as an HTML
  // attribute value.  '&', '<', '>' and both quote characters are escaped.
  static void Escape(const StringPiece& unescaped, GoogleString* buf);

  // Take escaped text and unescape it so its value can be interpreted.
  // Unknown or malformed entities are passed through unmodified.
  //
  // Note that Escape and Unescape are not guaranteed to be inverses of
  // one another, however Unescape(Escape(s)) == s.
  static void Unescape(const StringPiece& escaped, GoogleString* buf);

  // Elements that never have content or a close tag, e.g. <img ...>.
  static bool IsVoidElement(HtmlName::Keyword keyword);

  // Elements whose content is raw text up to the matching close tag,
  // e.g. <style> and <script>.
  static bool IsRawTextElement(HtmlName::Keyword keyword);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_HTML_HTML_KEYWORDS_H_
