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

#ifndef ASSETSPEED_KERNEL_HTML_HTML_FILTER_H_
#define ASSETSPEED_KERNEL_HTML_HTML_FILTER_H_

#include "assetspeed/kernel/base/basictypes.h"

namespace assetspeed {

class HtmlCharactersNode;
class HtmlCommentNode;
class HtmlDirectiveNode;
class HtmlElement;

// Base-class used to register for HTML Parser Callbacks.  Derive from this
// class and register with HtmlParse::AddFilter, or run it directly over a
// parsed document with HtmlParse::ApplyFilter.
class HtmlFilter {
 public:
  HtmlFilter();
  virtual ~HtmlFilter();

  // Starts a new document.  Filters should clear their state in this function,
  // as the same Filter instance may be used for multiple HTML documents.
  virtual void StartDocument() = 0;
  // Note: EndDocument will be called imediately before the last Flush call.
  virtual void EndDocument() = 0;

  // When an HTML element is encountered during parsing, each filter's
  // StartElement method is called.  The HtmlElement lives for the entire
  // duration of the document.  A filter may replace the element with
  // HtmlParse::ReplaceNode from EndElement, after its children have been
  // visited.
  virtual void StartElement(HtmlElement* element) = 0;
  virtual void EndElement(HtmlElement* element) = 0;

  // Called for HTML comments.
  virtual void Comment(HtmlCommentNode* comment) = 0;

  // Called for raw characters between tags, including the contents of
  // <style> and <script> blocks.
  virtual void Characters(HtmlCharactersNode* characters) = 0;

  // Called for HTML directives (e.g. <!doctype foobar>).
  virtual void Directive(HtmlDirectiveNode* directive) = 0;

  // The name of this filter -- used for logging and debugging.
  virtual const char* Name() const = 0;

 private:
  DISALLOW_COPY_AND_ASSIGN(HtmlFilter);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_HTML_HTML_FILTER_H_
