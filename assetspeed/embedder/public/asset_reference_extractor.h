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


#ifndef ASSETSPEED_EMBEDDER_PUBLIC_ASSET_REFERENCE_EXTRACTOR_H_
#define ASSETSPEED_EMBEDDER_PUBLIC_ASSET_REFERENCE_EXTRACTOR_H_

#include "assetspeed/embedder/public/asset_types.h"
#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/html/empty_html_filter.h"
#include "re2/re2.h"

namespace assetspeed {

class HtmlCharactersNode;
class HtmlElement;
class HtmlParse;

// Collects, in document order, every asset URL the embedder knows how to
// rewrite: image and media sources, and url() tokens in style attributes
// and <style> bodies.  Duplicates are kept; data: URLs and empty values
// are skipped.  The document is not modified.
class AssetReferenceExtractor : public EmptyHtmlFilter {
 public:
  // references is cleared at the start of each document.
  AssetReferenceExtractor(HtmlParse* html_parse,
                          AssetReferenceVector* references);
  virtual ~AssetReferenceExtractor();

  void StartDocument() override;
  void StartElement(HtmlElement* element) override;
  void Characters(HtmlCharactersNode* characters) override;
  const char* Name() const override { return "AssetReferenceExtractor"; }

 private:
  void AddReference(AssetReference::Context context, HtmlElement* element,
                    HtmlCharactersNode* characters, StringPiece path);
  void AddCssReferences(AssetReference::Context context, HtmlElement* element,
                        HtmlCharactersNode* characters, StringPiece css);

  HtmlParse* html_parse_;
  AssetReferenceVector* references_;
  RE2 font_face_pattern_;

  DISALLOW_COPY_AND_ASSIGN(AssetReferenceExtractor);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_EMBEDDER_PUBLIC_ASSET_REFERENCE_EXTRACTOR_H_
