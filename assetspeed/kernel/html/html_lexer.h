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

#ifndef ASSETSPEED_KERNEL_HTML_HTML_LEXER_H_
#define ASSETSPEED_KERNEL_HTML_HTML_LEXER_H_

#include <vector>

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

class HtmlElement;
class HtmlParse;

// Tokenizes HTML text and builds the node tree under a root element.
// The lexer is forgiving: text it cannot interpret as markup becomes
// characters, and unclosed elements are closed at end of input without
// synthesizing close tags.
class HtmlLexer {
 public:
  explicit HtmlLexer(HtmlParse* html_parse);
  ~HtmlLexer();

  void Parse(const StringPiece& text, HtmlElement* root);

 private:
  HtmlElement* Parent() const { return element_stack_.back(); }

  // Each Try method returns false without consuming input if the text at
  // pos_ is not the construct it looks for.
  bool TryComment();
  bool TryDirective();
  bool TryEndTag();
  bool TryStartTag();

  // Consumes a raw-text element body (e.g. <style>) up to its close tag.
  void ParseRawText(HtmlElement* element);

  // Scans a tag name starting at pos, returning its end.
  size_t ScanName(size_t pos) const;

  // Marks [begin, end) as literal text to be emitted as characters.
  void AddLiteral(size_t begin, size_t end);
  void FlushCharacters();

  HtmlParse* html_parse_;
  StringPiece text_;
  size_t pos_;
  size_t literal_begin_;
  size_t literal_end_;
  std::vector<HtmlElement*> element_stack_;

  DISALLOW_COPY_AND_ASSIGN(HtmlLexer);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_HTML_HTML_LEXER_H_
