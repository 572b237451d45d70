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

#include "assetspeed/kernel/html/html_writer_filter.h"

#include "base/logging.h"
#include "assetspeed/kernel/base/message_handler.h"
#include "assetspeed/kernel/base/writer.h"
#include "assetspeed/kernel/html/html_element.h"
#include "assetspeed/kernel/html/html_node.h"
#include "assetspeed/kernel/html/html_parse.h"

namespace assetspeed {

HtmlWriterFilter::HtmlWriterFilter(HtmlParse* html_parse)
    : html_parse_(html_parse),
      writer_(NULL),
      write_errors_(0) {
}

HtmlWriterFilter::~HtmlWriterFilter() {
}

void HtmlWriterFilter::EmitBuffer() {
  if (!writer_->Write(buffer_, html_parse_->message_handler())) {
    ++write_errors_;
  }
  buffer_.clear();
}

void HtmlWriterFilter::StartDocument() {
  CHECK(writer_ != NULL) << "set_writer must be called before parsing";
  write_errors_ = 0;
  buffer_.clear();
}

void HtmlWriterFilter::EndDocument() {
  if (!writer_->Flush(html_parse_->message_handler())) {
    ++write_errors_;
  }
  if (write_errors_ != 0) {
    html_parse_->message_handler()->Message(
        kError, "%s: %d writes failed while serializing",
        html_parse_->url().c_str(), write_errors_);
  }
}

void HtmlWriterFilter::StartElement(HtmlElement* element) {
  element->AppendStartTag(&buffer_);
  EmitBuffer();
}

void HtmlWriterFilter::EndElement(HtmlElement* element) {
  element->AppendEndTag(&buffer_);
  if (!buffer_.empty()) {
    EmitBuffer();
  }
}

void HtmlWriterFilter::Comment(HtmlCommentNode* comment) {
  comment->AppendMarkup(&buffer_);
  EmitBuffer();
}

void HtmlWriterFilter::Characters(HtmlCharactersNode* characters) {
  characters->AppendMarkup(&buffer_);
  EmitBuffer();
}

void HtmlWriterFilter::Directive(HtmlDirectiveNode* directive) {
  directive->AppendMarkup(&buffer_);
  EmitBuffer();
}

}  // namespace assetspeed
