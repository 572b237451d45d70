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


#include "assetspeed/embedder/public/asset_rewrite_filter.h"

#include "base/logging.h"
#include "assetspeed/embedder/public/css_tag_scanner.h"
#include "assetspeed/kernel/base/message_handler.h"
#include "assetspeed/kernel/base/string_writer.h"
#include "assetspeed/kernel/html/html_element.h"
#include "assetspeed/kernel/html/html_name.h"
#include "assetspeed/kernel/html/html_node.h"
#include "assetspeed/kernel/html/html_parse.h"

namespace assetspeed {

// Replaces the url() tokens of decided assets inside CSS text.
class AssetRewriteFilter::CssUrlRewriter : public CssTagScanner::Transformer {
 public:
  explicit CssUrlRewriter(AssetRewriteFilter* filter)
      : filter_(filter), changed_(false) {}
  virtual ~CssUrlRewriter() {}

  TransformStatus Transform(GoogleString* str) override {
    StringPiece path(*str);
    TrimWhitespace(&path);
    const AssetDecision* decision = filter_->FindDecision(path);
    if (decision == NULL) {
      return kNoChange;
    }
    switch (decision->kind) {
      case kInlineData:
        filter_->stats_.RecordOccurrence(kInlineData,
                                         decision->original_size);
        *str = decision->payload;
        changed_ = true;
        return kSuccess;
      case kDelegateUpload:
        filter_->stats_.RecordOccurrence(kDelegateUpload,
                                         decision->original_size);
        *str = decision->target_url;
        changed_ = true;
        return kSuccess;
      case kInlineText:
      case kExternalize:
        filter_->stats_.RecordOccurrence(kExternalize,
                                         decision->original_size);
        break;
    }
    return kNoChange;
  }

  bool changed() const { return changed_; }

 private:
  AssetRewriteFilter* filter_;
  bool changed_;

  DISALLOW_COPY_AND_ASSIGN(CssUrlRewriter);
};

AssetRewriteFilter::AssetRewriteFilter(HtmlParse* html_parse,
                                       const AssetDecisionMap* decisions)
    : html_parse_(html_parse),
      decisions_(decisions) {
}

AssetRewriteFilter::~AssetRewriteFilter() {
}

void AssetRewriteFilter::StartDocument() {
  stats_ = EmbeddingStats();
}

const AssetDecision* AssetRewriteFilter::FindDecision(StringPiece path) const {
  TrimWhitespace(&path);
  if (path.empty()) {
    return NULL;
  }
  AssetDecisionMap::const_iterator p = decisions_->find(path.as_string());
  return (p == decisions_->end()) ? NULL : &p->second;
}

void AssetRewriteFilter::StartElement(HtmlElement* element) {
  switch (element->keyword()) {
    case HtmlName::kImg:
      RewriteSource(element, true);
      break;
    case HtmlName::kVideo:
    case HtmlName::kAudio:
    case HtmlName::kSource:
      RewriteSource(element, false);
      break;
    default:
      break;
  }

  HtmlElement::Attribute* style = element->FindAttribute(HtmlName::kStyle);
  if (style != NULL && style->DecodedValueOrNull() != NULL) {
    GoogleString rewritten;
    if (RewriteCss(style->DecodedValueOrNull(), element, &rewritten)) {
      style->SetValue(rewritten);
    }
  }
}

void AssetRewriteFilter::RewriteSource(HtmlElement* element,
                                       bool can_replace_element) {
  HtmlElement::Attribute* src = element->FindAttribute(HtmlName::kSrc);
  if (src == NULL) {
    return;
  }
  const AssetDecision* decision = FindDecision(src->DecodedValueOrNull());
  if (decision == NULL) {
    return;
  }
  DecisionKind applied = decision->kind;
  switch (decision->kind) {
    case kInlineData:
      src->SetValue(decision->payload);
      break;
    case kDelegateUpload:
      src->SetValue(decision->target_url);
      break;
    case kInlineText:
      // The element itself is swapped out in EndElement.
      if (!can_replace_element) {
        applied = kExternalize;
      }
      break;
    case kExternalize:
      break;
  }
  stats_.RecordOccurrence(applied, decision->original_size);
}

void AssetRewriteFilter::EndElement(HtmlElement* element) {
  if (element->keyword() != HtmlName::kImg) {
    return;
  }
  const HtmlElement::Attribute* src = element->FindAttribute(HtmlName::kSrc);
  if (src == NULL) {
    return;
  }
  const AssetDecision* decision = FindDecision(src->DecodedValueOrNull());
  if (decision != NULL && decision->kind == kInlineText) {
    HtmlCharactersNode* markup =
        html_parse_->NewCharactersNode(element->parent(), decision->payload);
    if (!html_parse_->ReplaceNode(element, markup)) {
      html_parse_->message_handler()->Message(
          kWarning, "%s: could not inline %s", html_parse_->url().c_str(),
          decision->path.c_str());
    }
  }
}

void AssetRewriteFilter::Characters(HtmlCharactersNode* characters) {
  HtmlElement* parent = characters->parent();
  if (parent == NULL || parent->keyword() != HtmlName::kStyle) {
    return;
  }
  GoogleString rewritten;
  if (RewriteCss(characters->contents(), parent, &rewritten)) {
    characters->set_contents(rewritten);
  }
}

bool AssetRewriteFilter::RewriteCss(StringPiece css, HtmlElement* element,
                                    GoogleString* out) {
  if (!CssTagScanner::HasUrl(css)) {
    return false;
  }
  CssUrlRewriter rewriter(this);
  StringWriter writer(out);
  if (!CssTagScanner::TransformUrls(css, &writer, &rewriter,
                                    html_parse_->message_handler())) {
    html_parse_->message_handler()->Message(
        kWarning, "%s: could not rewrite CSS in <%s>",
        html_parse_->url().c_str(), element->name_str().c_str());
    return false;
  }
  return rewriter.changed();
}

}  // namespace assetspeed
