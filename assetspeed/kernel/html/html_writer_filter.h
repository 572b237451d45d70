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

#ifndef ASSETSPEED_KERNEL_HTML_HTML_WRITER_FILTER_H_
#define ASSETSPEED_KERNEL_HTML_HTML_WRITER_FILTER_H_

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/html/html_filter.h"

namespace assetspeed {

class HtmlCharactersNode;
class HtmlCommentNode;
class HtmlDirectiveNode;
class HtmlElement;
class HtmlParse;
class Writer;

// Serializes the document to a Writer.  Run it after every rewriting
// filter so it sees the final tree.
class HtmlWriterFilter : public HtmlFilter {
 public:
  explicit HtmlWriterFilter(HtmlParse* html_parse);
  virtual ~HtmlWriterFilter();

  void set_writer(Writer* writer) { writer_ = writer; }

  void StartDocument() override;
  void EndDocument() override;
  void StartElement(HtmlElement* element) override;
  void EndElement(HtmlElement* element) override;
  void Comment(HtmlCommentNode* comment) override;
  void Characters(HtmlCharactersNode* characters) override;
  void Directive(HtmlDirectiveNode* directive) override;
  const char* Name() const override { return "HtmlWriter"; }

  // Number of failed writes in the last document.
  int write_errors() const { return write_errors_; }

 private:
  void EmitBuffer();

  HtmlParse* html_parse_;
  Writer* writer_;
  GoogleString buffer_;
  int write_errors_;

  DISALLOW_COPY_AND_ASSIGN(HtmlWriterFilter);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_HTML_HTML_WRITER_FILTER_H_
