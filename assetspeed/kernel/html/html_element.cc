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

#include "assetspeed/kernel/html/html_element.h"

#include "base/logging.h"
#include "assetspeed/kernel/html/html_filter.h"
#include "assetspeed/kernel/html/html_keywords.h"

namespace assetspeed {

HtmlElement::Attribute::Attribute(const HtmlName& name,
                                  const StringPiece& escaped_value,
                                  bool has_value, QuoteStyle quote_style)
    : name_(name),
      quote_style_(quote_style),
      has_value_(has_value),
      modified_(false),
      escaped_value_(escaped_value.data(), escaped_value.size()) {
  HtmlKeywords::Unescape(escaped_value_, &decoded_value_);
}

void HtmlElement::Attribute::SetValue(const StringPiece& value) {
  value.CopyToString(&decoded_value_);
  HtmlKeywords::Escape(value, &escaped_value_);
  if (quote_style_ == NO_QUOTE) {
    quote_style_ = DOUBLE_QUOTE;
  }
  has_value_ = true;
  modified_ = true;
}

HtmlElement::HtmlElement(HtmlElement* parent, const HtmlName& name)
    : HtmlNode(parent),
      name_(name),
      style_(AUTO_CLOSE) {
}

HtmlElement::~HtmlElement() {
}

void HtmlElement::AddEscapedAttribute(const HtmlName& name,
                                      const StringPiece& escaped_value,
                                      QuoteStyle quote_style) {
  attributes_.push_back(std::unique_ptr<Attribute>(
      new Attribute(name, escaped_value, true, quote_style)));
}

void HtmlElement::AddValuelessAttribute(const HtmlName& name) {
  attributes_.push_back(std::unique_ptr<Attribute>(
      new Attribute(name, StringPiece(), false, NO_QUOTE)));
}

const HtmlElement::Attribute* HtmlElement::FindAttribute(
    HtmlName::Keyword keyword) const {
  for (int i = 0, n = attributes_.size(); i < n; ++i) {
    if (attributes_[i]->keyword() == keyword) {
      return attributes_[i].get();
    }
  }
  return NULL;
}

bool HtmlElement::IsModified() const {
  for (int i = 0, n = attributes_.size(); i < n; ++i) {
    if (attributes_[i]->modified()) {
      return true;
    }
  }
  return false;
}

void HtmlElement::ApplyFilter(HtmlFilter* filter) {
  bool visible = (style_ != INVISIBLE);
  if (visible) {
    filter->StartElement(this);
  }
  // Filters may replace the child being visited, so re-fetch by index.
  for (int i = 0; i < static_cast<int>(children_.size()); ++i) {
    children_[i]->ApplyFilter(filter);
  }
  if (visible) {
    filter->EndElement(this);
  }
}

void HtmlElement::AppendStartTag(GoogleString* buf) const {
  if (style_ == INVISIBLE) {
    return;
  }
  if (!source_start_tag_.empty() && !IsModified()) {
    *buf += source_start_tag_;
    return;
  }
  StrAppend(buf, "<", name_.value());
  for (int i = 0, n = attributes_.size(); i < n; ++i) {
    const Attribute& attr = *attributes_[i];
    StrAppend(buf, " ", attr.name_str());
    const char* value = attr.escaped_value();
    if (value != NULL) {
      switch (attr.quote_style()) {
        case NO_QUOTE:
          StrAppend(buf, "=", value);
          break;
        case SINGLE_QUOTE:
          StrAppend(buf, "='", value, "'");
          break;
        case DOUBLE_QUOTE:
          StrAppend(buf, "=\"", value, "\"");
          break;
      }
    }
  }
  *buf += (style_ == BRIEF_CLOSE) ? "/>" : ">";
}

void HtmlElement::AppendEndTag(GoogleString* buf) const {
  switch (style_) {
    case EXPLICIT_CLOSE:
      if (!source_end_tag_.empty()) {
        *buf += source_end_tag_;
      } else {
        StrAppend(buf, "</", name_.value(), ">");
      }
      break;
    case AUTO_CLOSE:
      if (!HtmlKeywords::IsVoidElement(keyword())) {
        StrAppend(buf, "</", name_.value(), ">");
      }
      break;
    case IMPLICIT_CLOSE:
    case BRIEF_CLOSE:
    case UNCLOSED:
    case INVISIBLE:
      break;
  }
}

void HtmlElement::AppendMarkup(GoogleString* buf) const {
  AppendStartTag(buf);
  for (int i = 0, n = children_.size(); i < n; ++i) {
    children_[i]->AppendMarkup(buf);
  }
  AppendEndTag(buf);
}

GoogleString HtmlElement::ToString() const {
  GoogleString buf;
  AppendMarkup(&buf);
  return buf;
}

void HtmlElement::AppendChild(HtmlNode* node) {
  node->set_parent(this);
  children_.push_back(std::unique_ptr<HtmlNode>(node));
}

int HtmlElement::ChildIndex(const HtmlNode* node) const {
  for (int i = 0, n = children_.size(); i < n; ++i) {
    if (children_[i].get() == node) {
      return i;
    }
  }
  return -1;
}

std::unique_ptr<HtmlNode> HtmlElement::ReleaseChild(int index,
                                                    HtmlNode* replacement) {
  DCHECK(index >= 0 && index < static_cast<int>(children_.size()));
  std::unique_ptr<HtmlNode> old(children_[index].release());
  replacement->set_parent(this);
  children_[index].reset(replacement);
  return old;
}

}  // namespace assetspeed
