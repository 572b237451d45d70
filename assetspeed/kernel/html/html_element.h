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

#ifndef ASSETSPEED_KERNEL_HTML_HTML_ELEMENT_H_
#define ASSETSPEED_KERNEL_HTML_HTML_ELEMENT_H_

#include <memory>
#include <vector>

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/html/html_name.h"
#include "assetspeed/kernel/html/html_node.h"

namespace assetspeed {

class HtmlElement : public HtmlNode {
 public:
  // Tags can be closed in three ways: implicitly (e.g. <img ..>),
  // briefly (e.g. <br/>), or explicitly (<a...>...</a>).  The
  // Lexer will always record the way it parsed a tag, but synthesized
  // elements will have AUTO_CLOSE, and rewritten elements may
  // no longer qualify for the closing style with which they were
  // parsed.
  enum Style {
    AUTO_CLOSE,      // synthesized tag, or not yet closed in source
    IMPLICIT_CLOSE,  // E.g. <img...> <meta...> <link...> <br...> <input...>
    EXPLICIT_CLOSE,  // E.g. <a href=...>anchor</a>
    BRIEF_CLOSE,     // E.g. <head/>
    UNCLOSED,        // Was never closed in source, so don't serialize close-tag
    INVISIBLE,       // Programatically hidden element, e.g. the document root
  };

  // Various ways things can be quoted (or not)
  enum QuoteStyle {
    NO_QUOTE,
    SINGLE_QUOTE,
    DOUBLE_QUOTE
  };

  class Attribute {
   public:
    // Attribute names are case-insensitive for keyword lookup, but the
    // original spelling is kept for serialization.
    const GoogleString& name_str() const { return name_.value(); }
    HtmlName::Keyword keyword() const { return name_.keyword(); }

    // Returns the value in its original directly-from-http form,
    // or NULL if the attribute has no value (e.g. <video controls>).
    const char* escaped_value() const {
      return has_value_ ? escaped_value_.c_str() : NULL;
    }

    // Returns the value with HTML entities decoded, or NULL if the
    // attribute has no value.
    const char* DecodedValueOrNull() const {
      return has_value_ ? decoded_value_.c_str() : NULL;
    }

    QuoteStyle quote_style() const { return quote_style_; }

    // Returns true if the value was changed since the attribute was
    // parsed.
    bool modified() const { return modified_; }

    // Changes the value of the attribute, escaping it as needed for
    // its quote style.  An unquoted attribute becomes double-quoted.
    void SetValue(const StringPiece& value);

   private:
    friend class HtmlElement;

    Attribute(const HtmlName& name, const StringPiece& escaped_value,
              bool has_value, QuoteStyle quote_style);

    HtmlName name_;
    QuoteStyle quote_style_;
    bool has_value_;
    bool modified_;
    GoogleString escaped_value_;
    GoogleString decoded_value_;

    DISALLOW_COPY_AND_ASSIGN(Attribute);
  };

  virtual ~HtmlElement();

  // Add a copy of an attribute to this element.  The attribute is parsed
  // from source, so the element is not considered modified.
  void AddEscapedAttribute(const HtmlName& name,
                           const StringPiece& escaped_value,
                           QuoteStyle quote_style);

  // Adds a valueless attribute, e.g. "controls" in <video controls>.
  void AddValuelessAttribute(const HtmlName& name);

  // Look up an attribute by keyword or name.  Returns NULL if not found.
  const Attribute* FindAttribute(HtmlName::Keyword keyword) const;
  Attribute* FindAttribute(HtmlName::Keyword keyword) {
    const HtmlElement* const_this = this;
    const Attribute* result = const_this->FindAttribute(keyword);
    return const_cast<Attribute*>(result);
  }

  // Look up the decoded value of an attribute.  Returns NULL if the
  // attribute is absent or has no value.
  const char* AttributeValue(HtmlName::Keyword keyword) const {
    const Attribute* attribute = FindAttribute(keyword);
    if (attribute != NULL) {
      return attribute->DecodedValueOrNull();
    }
    return NULL;
  }

  int attribute_size() const { return attributes_.size(); }
  const Attribute& attribute(int i) const { return *attributes_[i]; }
  Attribute* mutable_attribute(int i) { return attributes_[i].get(); }

  // Children, in document order.
  int size() const { return children_.size(); }
  HtmlNode* child(int i) const { return children_[i].get(); }

  const GoogleString& name_str() const { return name_.value(); }
  HtmlName::Keyword keyword() const { return name_.keyword(); }
  const HtmlName& name() const { return name_; }

  Style style() const { return style_; }
  void set_style(Style style) { style_ = style; }

  // Returns true if any attribute was modified since parsing, in which
  // case the start tag is rebuilt from the attributes on output rather
  // than copied from the source.
  bool IsModified() const;

  void ApplyFilter(HtmlFilter* filter) override;
  void AppendMarkup(GoogleString* buf) const override;

  // Start and end tags as they should be serialized.  The start tag is
  // the original source text unless an attribute was modified.
  void AppendStartTag(GoogleString* buf) const;
  void AppendEndTag(GoogleString* buf) const;

  // Serializes the whole subtree.
  GoogleString ToString() const;

 private:
  friend class HtmlLexer;
  friend class HtmlParse;

  HtmlElement(HtmlElement* parent, const HtmlName& name);

  void set_source_start_tag(const StringPiece& tag) {
    tag.CopyToString(&source_start_tag_);
  }
  void set_source_end_tag(const StringPiece& tag) {
    tag.CopyToString(&source_end_tag_);
  }

  // Children are appended by HtmlParse while the document is built, and
  // may be swapped out by HtmlParse::ReplaceNode.
  void AppendChild(HtmlNode* node);
  int ChildIndex(const HtmlNode* node) const;
  std::unique_ptr<HtmlNode> ReleaseChild(int index, HtmlNode* replacement);

  HtmlName name_;
  Style style_;
  std::vector<std::unique_ptr<Attribute> > attributes_;
  std::vector<std::unique_ptr<HtmlNode> > children_;
  GoogleString source_start_tag_;
  GoogleString source_end_tag_;

  DISALLOW_COPY_AND_ASSIGN(HtmlElement);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_HTML_HTML_ELEMENT_H_
