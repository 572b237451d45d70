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

#include "assetspeed/kernel/html/html_lexer.h"

#include <cctype>

#include "assetspeed/kernel/html/html_element.h"
#include "assetspeed/kernel/html/html_keywords.h"
#include "assetspeed/kernel/html/html_name.h"
#include "assetspeed/kernel/html/html_node.h"
#include "assetspeed/kernel/html/html_parse.h"

namespace assetspeed {

namespace {

const size_t kNone = StringPiece::npos;

bool IsTagNameStart(char c) {
  return isalpha(static_cast<unsigned char>(c)) != 0;
}

bool IsNameTerminator(char c) {
  return IsHtmlSpace(c) || (c == '>') || (c == '/');
}

struct ParsedAttribute {
  StringPiece name;
  StringPiece value;
  bool has_value;
  HtmlElement::QuoteStyle quote_style;
};

}  // namespace

HtmlLexer::HtmlLexer(HtmlParse* html_parse)
    : html_parse_(html_parse),
      pos_(0),
      literal_begin_(kNone),
      literal_end_(kNone) {
}

HtmlLexer::~HtmlLexer() {
}

void HtmlLexer::Parse(const StringPiece& text, HtmlElement* root) {
  text_ = text;
  pos_ = 0;
  literal_begin_ = kNone;
  literal_end_ = kNone;
  element_stack_.clear();
  element_stack_.push_back(root);

  while (pos_ < text_.size()) {
    if ((text_[pos_] == '<') &&
        (TryComment() || TryDirective() || TryEndTag() || TryStartTag())) {
      continue;
    }
    size_t next = text_.find('<', pos_ + 1);
    if (next == kNone) {
      next = text_.size();
    }
    AddLiteral(pos_, next);
    pos_ = next;
  }
  FlushCharacters();

  // Whatever is still open was never closed in the source.
  for (int i = element_stack_.size() - 1; i >= 1; --i) {
    element_stack_[i]->set_style(HtmlElement::UNCLOSED);
  }
  element_stack_.clear();
}

void HtmlLexer::AddLiteral(size_t begin, size_t end) {
  if (literal_begin_ == kNone) {
    literal_begin_ = begin;
  }
  literal_end_ = end;
}

void HtmlLexer::FlushCharacters() {
  if (literal_begin_ != kNone) {
    if (literal_end_ > literal_begin_) {
      HtmlElement* parent = Parent();
      html_parse_->AppendChild(parent, html_parse_->NewCharactersNode(
          parent, text_.substr(literal_begin_, literal_end_ - literal_begin_)));
    }
    literal_begin_ = kNone;
    literal_end_ = kNone;
  }
}

size_t HtmlLexer::ScanName(size_t pos) const {
  while ((pos < text_.size()) && !IsNameTerminator(text_[pos])) {
    ++pos;
  }
  return pos;
}

bool HtmlLexer::TryComment() {
  if (!text_.substr(pos_).starts_with("<!--")) {
    return false;
  }
  FlushCharacters();
  size_t body = pos_ + 4;
  size_t close = text_.find("-->", body);
  bool terminated = (close != kNone);
  size_t end = terminated ? close : text_.size();
  HtmlElement* parent = Parent();
  html_parse_->AppendChild(parent, html_parse_->NewCommentNode(
      parent, text_.substr(body, end - body), terminated));
  pos_ = terminated ? (close + 3) : text_.size();
  return true;
}

bool HtmlLexer::TryDirective() {
  if (pos_ + 1 >= text_.size()) {
    return false;
  }
  char c = text_[pos_ + 1];
  if ((c != '!') && (c != '?')) {
    return false;
  }
  size_t close = text_.find('>', pos_ + 2);
  if (close == kNone) {
    return false;
  }
  FlushCharacters();
  HtmlElement* parent = Parent();
  html_parse_->AppendChild(parent, html_parse_->NewDirectiveNode(
      parent, text_.substr(pos_ + 1, close - pos_ - 1)));
  pos_ = close + 1;
  return true;
}

bool HtmlLexer::TryEndTag() {
  if ((pos_ + 2 >= text_.size()) || (text_[pos_ + 1] != '/') ||
      !IsTagNameStart(text_[pos_ + 2])) {
    return false;
  }
  size_t name_end = ScanName(pos_ + 2);
  size_t close = text_.find('>', name_end);
  if (close == kNone) {
    return false;
  }
  StringPiece name = text_.substr(pos_ + 2, name_end - pos_ - 2);
  size_t tag_end = close + 1;

  int match = -1;
  for (int i = element_stack_.size() - 1; i >= 1; --i) {
    if (StringCaseEqual(element_stack_[i]->name_str(), name)) {
      match = i;
      break;
    }
  }
  if (match < 0) {
    // A close tag with no matching open element is kept verbatim as text.
    AddLiteral(pos_, tag_end);
    pos_ = tag_end;
    return true;
  }

  FlushCharacters();
  for (int i = element_stack_.size() - 1; i > match; --i) {
    element_stack_[i]->set_style(HtmlElement::UNCLOSED);
  }
  HtmlElement* element = element_stack_[match];
  element->set_style(HtmlElement::EXPLICIT_CLOSE);
  element->set_source_end_tag(text_.substr(pos_, tag_end - pos_));
  element_stack_.resize(match);
  pos_ = tag_end;
  return true;
}

bool HtmlLexer::TryStartTag() {
  const size_t size = text_.size();
  if ((pos_ + 1 >= size) || !IsTagNameStart(text_[pos_ + 1])) {
    return false;
  }
  size_t name_end = ScanName(pos_ + 1);
  HtmlName name(text_.substr(pos_ + 1, name_end - pos_ - 1));

  std::vector<ParsedAttribute> attributes;
  size_t p = name_end;
  bool brief = false;
  bool closed = false;
  while (p < size) {
    char c = text_[p];
    if (IsHtmlSpace(c)) {
      ++p;
      continue;
    }
    if (c == '>') {
      closed = true;
      ++p;
      break;
    }
    if (c == '/') {
      if ((p + 1 < size) && (text_[p + 1] == '>')) {
        brief = true;
        closed = true;
        p += 2;
        break;
      }
      ++p;
      continue;
    }

    size_t attr_begin = p;
    while ((p < size) && !IsHtmlSpace(text_[p]) && (text_[p] != '=') &&
           (text_[p] != '>') &&
           !((text_[p] == '/') && (p + 1 < size) && (text_[p + 1] == '>'))) {
      ++p;
    }
    ParsedAttribute attr;
    attr.name = text_.substr(attr_begin, p - attr_begin);
    attr.has_value = false;
    attr.quote_style = HtmlElement::NO_QUOTE;

    size_t q = p;
    while ((q < size) && IsHtmlSpace(text_[q])) {
      ++q;
    }
    if ((q < size) && (text_[q] == '=')) {
      ++q;
      while ((q < size) && IsHtmlSpace(text_[q])) {
        ++q;
      }
      if (q >= size) {
        p = size;
        break;
      }
      char quote = text_[q];
      if ((quote == '"') || (quote == '\'')) {
        size_t value_end = text_.find(quote, q + 1);
        if (value_end == kNone) {
          p = size;
          break;
        }
        attr.value = text_.substr(q + 1, value_end - q - 1);
        attr.quote_style = (quote == '"') ? HtmlElement::DOUBLE_QUOTE
                                          : HtmlElement::SINGLE_QUOTE;
        p = value_end + 1;
      } else {
        size_t value_begin = q;
        while ((q < size) && !IsHtmlSpace(text_[q]) && (text_[q] != '>')) {
          ++q;
        }
        attr.value = text_.substr(value_begin, q - value_begin);
        p = q;
      }
      attr.has_value = true;
    }
    if (!attr.name.empty()) {
      attributes.push_back(attr);
    }
  }
  if (!closed) {
    // An unterminated tag is treated as text.
    return false;
  }

  FlushCharacters();
  HtmlElement* parent = Parent();
  HtmlElement* element = html_parse_->NewElement(parent, name);
  for (int i = 0, n = attributes.size(); i < n; ++i) {
    const ParsedAttribute& attr = attributes[i];
    HtmlName attr_name(attr.name);
    if (attr.has_value) {
      element->AddEscapedAttribute(attr_name, attr.value, attr.quote_style);
    } else {
      element->AddValuelessAttribute(attr_name);
    }
  }
  element->set_source_start_tag(text_.substr(pos_, p - pos_));
  html_parse_->AppendChild(parent, element);
  pos_ = p;

  if (brief) {
    element->set_style(HtmlElement::BRIEF_CLOSE);
  } else if (HtmlKeywords::IsVoidElement(element->keyword())) {
    element->set_style(HtmlElement::IMPLICIT_CLOSE);
  } else if (HtmlKeywords::IsRawTextElement(element->keyword())) {
    ParseRawText(element);
  } else {
    element_stack_.push_back(element);
  }
  return true;
}

void HtmlLexer::ParseRawText(HtmlElement* element) {
  const size_t size = text_.size();
  const GoogleString& name = element->name_str();
  size_t close = kNone;
  size_t search = pos_;
  while ((search = text_.find("</", search)) != kNone) {
    size_t name_begin = search + 2;
    if ((name_begin + name.size() <= size) &&
        StringCaseEqual(text_.substr(name_begin, name.size()), name)) {
      size_t after = name_begin + name.size();
      if ((after >= size) || IsNameTerminator(text_[after])) {
        close = search;
        break;
      }
    }
    search += 2;
  }

  size_t body_end = (close == kNone) ? size : close;
  if (body_end > pos_) {
    html_parse_->AppendChild(element, html_parse_->NewCharactersNode(
        element, text_.substr(pos_, body_end - pos_)));
  }
  if (close == kNone) {
    element->set_style(HtmlElement::UNCLOSED);
    pos_ = size;
    return;
  }
  size_t tag_end = text_.find('>', close);
  tag_end = (tag_end == kNone) ? size : (tag_end + 1);
  element->set_source_end_tag(text_.substr(close, tag_end - close));
  element->set_style(HtmlElement::EXPLICIT_CLOSE);
  pos_ = tag_end;
}

}  // namespace assetspeed
