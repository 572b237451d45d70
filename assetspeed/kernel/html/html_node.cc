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

#include "assetspeed/kernel/html/html_node.h"

#include "assetspeed/kernel/html/html_filter.h"

namespace assetspeed {

HtmlNode::~HtmlNode() {}

HtmlLeafNode::HtmlLeafNode(HtmlElement* parent, const StringPiece& contents)
    : HtmlNode(parent),
      contents_(contents.data(), contents.size()) {
}

HtmlLeafNode::~HtmlLeafNode() {}

HtmlCharactersNode::~HtmlCharactersNode() {}

void HtmlCharactersNode::ApplyFilter(HtmlFilter* filter) {
  filter->Characters(this);
}

void HtmlCharactersNode::AppendMarkup(GoogleString* buf) const {
  *buf += contents();
}

HtmlCommentNode::~HtmlCommentNode() {}

void HtmlCommentNode::ApplyFilter(HtmlFilter* filter) {
  filter->Comment(this);
}

void HtmlCommentNode::AppendMarkup(GoogleString* buf) const {
  StrAppend(buf, "<!--", contents(), terminated_ ? "-->" : "");
}

HtmlDirectiveNode::~HtmlDirectiveNode() {}

void HtmlDirectiveNode::ApplyFilter(HtmlFilter* filter) {
  filter->Directive(this);
}

void HtmlDirectiveNode::AppendMarkup(GoogleString* buf) const {
  StrAppend(buf, "<", contents(), ">");
}

}  // namespace assetspeed
