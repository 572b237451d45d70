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

#include "assetspeed/kernel/html/html_parse.h"

#include "base/logging.h"
#include "assetspeed/kernel/base/message_handler.h"
#include "assetspeed/kernel/html/html_element.h"
#include "assetspeed/kernel/html/html_filter.h"
#include "assetspeed/kernel/html/html_lexer.h"
#include "assetspeed/kernel/html/html_node.h"

namespace assetspeed {

HtmlParse::HtmlParse(MessageHandler* message_handler)
    : message_handler_(message_handler) {
  Clear();
}

HtmlParse::~HtmlParse() {
}

void HtmlParse::AddFilter(HtmlFilter* filter) {
  filters_.push_back(filter);
}

void HtmlParse::Clear() {
  root_.reset(new HtmlElement(NULL, HtmlName(HtmlName::kNotAKeyword, "")));
  root_->set_style(HtmlElement::INVISIBLE);
  dead_nodes_.clear();
  url_.clear();
  text_.clear();
}

bool HtmlParse::StartParse(const StringPiece& url) {
  Clear();
  url.CopyToString(&url_);
  PS_DLOG_INFO(message_handler_, "Parsing %s", url_.c_str());
  return true;
}

void HtmlParse::ParseText(const StringPiece& text) {
  text.AppendToString(&text_);
}

void HtmlParse::FinishParse() {
  HtmlLexer lexer(this);
  lexer.Parse(text_, root_.get());
  text_.clear();
  for (int i = 0, n = filters_.size(); i < n; ++i) {
    ApplyFilter(filters_[i]);
  }
}

void HtmlParse::ApplyFilter(HtmlFilter* filter) {
  filter->StartDocument();
  root_->ApplyFilter(filter);
  filter->EndDocument();
}

HtmlCharactersNode* HtmlParse::NewCharactersNode(HtmlElement* parent,
                                                 const StringPiece& literal) {
  return new HtmlCharactersNode(parent, literal);
}

HtmlCommentNode* HtmlParse::NewCommentNode(HtmlElement* parent,
                                           const StringPiece& contents,
                                           bool terminated) {
  return new HtmlCommentNode(parent, contents, terminated);
}

HtmlDirectiveNode* HtmlParse::NewDirectiveNode(HtmlElement* parent,
                                               const StringPiece& contents) {
  return new HtmlDirectiveNode(parent, contents);
}

HtmlElement* HtmlParse::NewElement(HtmlElement* parent,
                                   const HtmlName& name) {
  return new HtmlElement(parent, name);
}

HtmlName HtmlParse::MakeName(HtmlName::Keyword keyword) const {
  return HtmlName(keyword, HtmlName::KeywordToString(keyword));
}

void HtmlParse::AppendChild(HtmlElement* parent, HtmlNode* new_node) {
  DCHECK(parent != NULL);
  parent->AppendChild(new_node);
}

bool HtmlParse::ReplaceNode(HtmlNode* existing_node, HtmlNode* new_node) {
  HtmlElement* parent = existing_node->parent();
  int index = (parent == NULL) ? -1 : parent->ChildIndex(existing_node);
  if (index < 0) {
    message_handler_->Message(kError, "%s: cannot replace a node that is "
                              "not in the document", url_.c_str());
    delete new_node;
    return false;
  }
  dead_nodes_.push_back(parent->ReleaseChild(index, new_node));
  return true;
}

}  // namespace assetspeed
