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


#include "assetspeed/embedder/public/asset_reference_extractor.h"

#include "base/logging.h"
#include "assetspeed/embedder/public/css_tag_scanner.h"
#include "assetspeed/kernel/base/message_handler.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_writer.h"
#include "assetspeed/kernel/html/html_element.h"
#include "assetspeed/kernel/html/html_name.h"
#include "assetspeed/kernel/html/html_node.h"
#include "assetspeed/kernel/html/html_parse.h"
#include "assetspeed/kernel/http/data_url.h"

namespace assetspeed {

namespace {

// A whole @font-face rule.  Font-face descriptors cannot nest braces, so
// the rule ends at the first '}'.
const char kFontFaceRule[] = "(?i)(@font-face\\s*\\{[^}]*\\})";

}  // namespace

AssetReferenceExtractor::AssetReferenceExtractor(
    HtmlParse* html_parse, AssetReferenceVector* references)
    : html_parse_(html_parse),
      references_(references),
      font_face_pattern_(kFontFaceRule) {
  DCHECK(font_face_pattern_.ok()) << font_face_pattern_.error();
}

AssetReferenceExtractor::~AssetReferenceExtractor() {
}

void AssetReferenceExtractor::StartDocument() {
  references_->clear();
}

void AssetReferenceExtractor::StartElement(HtmlElement* element) {
  switch (element->keyword()) {
    case HtmlName::kImg:
      AddReference(AssetReference::kImageSource, element, NULL,
                   element->AttributeValue(HtmlName::kSrc));
      break;
    case HtmlName::kVideo:
    case HtmlName::kAudio:
    case HtmlName::kSource:
      AddReference(AssetReference::kMediaSource, element, NULL,
                   element->AttributeValue(HtmlName::kSrc));
      break;
    default:
      break;
  }
  const char* style = element->AttributeValue(HtmlName::kStyle);
  if (style != NULL) {
    AddCssReferences(AssetReference::kStyleAttribute, element, NULL, style);
  }
}

void AssetReferenceExtractor::Characters(HtmlCharactersNode* characters) {
  HtmlElement* parent = characters->parent();
  if (parent == NULL || parent->keyword() != HtmlName::kStyle) {
    return;
  }

  // Split the block into the text between @font-face rules and the rules
  // themselves, so each url() is tagged with where it was found.
  const GoogleString& css = characters->contents();
  re2::StringPiece input(css.data(), css.size());
  re2::StringPiece rule;
  const char* last = css.data();
  while (RE2::FindAndConsume(&input, font_face_pattern_, &rule)) {
    AddCssReferences(AssetReference::kStyleBlock, parent, characters,
                     StringPiece(last, rule.data() - last));
    AddCssReferences(AssetReference::kFontFace, parent, characters,
                     StringPiece(rule.data(), rule.size()));
    last = rule.data() + rule.size();
  }
  AddCssReferences(AssetReference::kStyleBlock, parent, characters,
                   StringPiece(last, css.data() + css.size() - last));
}

void AssetReferenceExtractor::AddReference(
    AssetReference::Context context, HtmlElement* element,
    HtmlCharactersNode* characters, StringPiece path) {
  TrimWhitespace(&path);
  if (path.empty() || IsDataUrl(path)) {
    return;
  }
  references_->push_back(AssetReference());
  AssetReference& reference = references_->back();
  reference.context = context;
  reference.element = element;
  reference.characters = characters;
  path.CopyToString(&reference.path);
}

void AssetReferenceExtractor::AddCssReferences(
    AssetReference::Context context, HtmlElement* element,
    HtmlCharactersNode* characters, StringPiece css) {
  if (!CssTagScanner::HasUrl(css)) {
    return;
  }
  StringVector urls;
  CssUrlCollector collector(&urls);
  GoogleString unchanged;
  StringWriter writer(&unchanged);
  if (!CssTagScanner::TransformUrls(css, &writer, &collector,
                                    html_parse_->message_handler())) {
    html_parse_->message_handler()->Message(
        kWarning, "%s: could not scan CSS in %s", html_parse_->url().c_str(),
        element->name_str().c_str());
  }
  for (int i = 0, n = urls.size(); i < n; ++i) {
    AddReference(context, element, characters, urls[i]);
  }
}

}  // namespace assetspeed
