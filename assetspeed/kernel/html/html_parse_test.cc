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

// Unit-test the html lexer, tree and writer.

#include "assetspeed/kernel/html/html_parse.h"

#include <cctype>

#include "assetspeed/kernel/base/gtest.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/html/empty_html_filter.h"
#include "assetspeed/kernel/html/html_element.h"
#include "assetspeed/kernel/html/html_name.h"
#include "assetspeed/kernel/html/html_node.h"
#include "assetspeed/kernel/html/html_parse_test_base.h"

namespace assetspeed {

namespace {

class HtmlParseTest : public HtmlParseTestBase {
};

TEST_F(HtmlParseTest, RoundTripIsExact) {
  ValidateNoChanges("round_trip",
                    "<!doctype html><!-- a comment -->\n"
                    "<div  class = 'hero'  ><IMG SRC=a.png alt=\"x &amp; y\">"
                    "<br/>text &lt; more<p>unclosed paragraph</div>");
}

TEST_F(HtmlParseTest, RawTextIsNotParsed) {
  ValidateNoChanges("raw_text",
                    "<style>a > b { background: url(<b>.png) }</style>"
                    "<script>if (a < b) { document.write('</div>'); }"
                    "</script>");
}

TEST_F(HtmlParseTest, UnterminatedConstructsAreText) {
  ValidateNoChanges("unterminated", "a < b and <img src='x.png");
}

TEST_F(HtmlParseTest, StrayCloseTagIsKept) {
  ValidateNoChanges("stray_close", "<span>x</span></section>y");
}

TEST_F(HtmlParseTest, UnclosedStyleAtEnd) {
  ValidateNoChanges("unclosed_style", "<style>body{}");
}

class ElementCollector : public EmptyHtmlFilter {
 public:
  void StartElement(HtmlElement* element) override {
    names_.push_back(element->name_str());
  }
  void Characters(HtmlCharactersNode* characters) override {
    chars_.push_back(characters->contents());
  }
  const char* Name() const override { return "ElementCollector"; }

  StringVector names_;
  StringVector chars_;
};

TEST_F(HtmlParseTest, TreeStructure) {
  ElementCollector collector;
  html_parse_.AddFilter(&collector);
  Parse("tree", "<div><img src=a.png><style>p{}</style></div>");
  ASSERT_EQ(5, collector.names_.size());
  EXPECT_EQ("html", collector.names_[0]);
  EXPECT_EQ("body", collector.names_[1]);
  EXPECT_EQ("div", collector.names_[2]);
  EXPECT_EQ("img", collector.names_[3]);
  EXPECT_EQ("style", collector.names_[4]);
  ASSERT_EQ(3, collector.chars_.size());
  EXPECT_EQ("p{}", collector.chars_[1]);
}

TEST_F(HtmlParseTest, AppliedFilterIsNotKeptForLaterParses) {
  ElementCollector collector;
  Parse("first", "<img src=a.png>");
  html_parse_.ApplyFilter(&collector);
  ASSERT_EQ(3, collector.names_.size());
  EXPECT_EQ("img", collector.names_[2]);

  Parse("second", "<div></div><div></div>");
  EXPECT_EQ(3, collector.names_.size());
  EXPECT_EQ("<html><body>\n<div></div><div></div></body></html>\n",
            output_buffer_);
}

class AttributeDecoder : public EmptyHtmlFilter {
 public:
  AttributeDecoder() : parent_keyword_(HtmlName::kNotAKeyword) {}

  void StartElement(HtmlElement* element) override {
    if (element->keyword() == HtmlName::kImg) {
      const char* alt = element->AttributeValue(HtmlName::kAlt);
      if (alt != NULL) {
        alt_ = alt;
      }
      parent_keyword_ = element->parent()->keyword();
    }
  }
  const char* Name() const override { return "AttributeDecoder"; }

  GoogleString alt_;
  HtmlName::Keyword parent_keyword_;
};

TEST_F(HtmlParseTest, AttributesAreDecoded) {
  AttributeDecoder decoder;
  html_parse_.AddFilter(&decoder);
  Parse("decode", "<header><img alt=\"Tom &amp; Jerry &#39;s\"></header>");
  EXPECT_EQ("Tom & Jerry 's", decoder.alt_);
  EXPECT_EQ(HtmlName::kHeader, decoder.parent_keyword_);
}

// Rewrites every img src to upper case.
class SrcUpcaser : public EmptyHtmlFilter {
 public:
  void StartElement(HtmlElement* element) override {
    HtmlElement::Attribute* src = element->FindAttribute(HtmlName::kSrc);
    if ((element->keyword() == HtmlName::kImg) && (src != NULL)) {
      GoogleString value = src->DecodedValueOrNull();
      for (size_t i = 0; i < value.size(); ++i) {
        value[i] = toupper(value[i]);
      }
      src->SetValue(value);
    }
  }
  const char* Name() const override { return "SrcUpcaser"; }
};

TEST_F(HtmlParseTest, ModifiedAttributeRebuildsOnlyThatTag) {
  SrcUpcaser upcaser;
  html_parse_.AddFilter(&upcaser);
  ValidateExpected("modify",
                   "<div  id=x><img src=a.png   alt='q\"'></div>",
                   "<div  id=x><img src=\"A.PNG\" alt='q\"'></div>");
}

// Replaces every <img> with a text node.
class ImgReplacer : public EmptyHtmlFilter {
 public:
  explicit ImgReplacer(HtmlParse* html_parse) : html_parse_(html_parse) {}
  void EndElement(HtmlElement* element) override {
    if (element->keyword() == HtmlName::kImg) {
      EXPECT_TRUE(html_parse_->ReplaceNode(
          element, html_parse_->NewCharactersNode(element->parent(),
                                                  "<svg></svg>")));
    }
  }
  const char* Name() const override { return "ImgReplacer"; }

 private:
  HtmlParse* html_parse_;
};

TEST_F(HtmlParseTest, ReplaceCurrentElement) {
  ImgReplacer replacer(&html_parse_);
  html_parse_.AddFilter(&replacer);
  ValidateExpected("replace",
                   "<p><img src=a.svg>x<img src=b.svg/></p>",
                   "<p><svg></svg>x<svg></svg></p>");
  EXPECT_EQ(0, message_handler_.SeriousMessages());
}

TEST_F(HtmlParseTest, KeywordLookupIsCaseInsensitive) {
  EXPECT_EQ(HtmlName::kImg, HtmlName::Lookup("IMG"));
  EXPECT_EQ(HtmlName::kStyle, HtmlName::Lookup("Style"));
  EXPECT_EQ(HtmlName::kNotAKeyword, HtmlName::Lookup("blink"));
  EXPECT_STREQ("header", HtmlName::KeywordToString(HtmlName::kHeader));
}

}  // namespace

}  // namespace assetspeed
