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


#ifndef ASSETSPEED_EMBEDDER_PUBLIC_ASSET_REWRITE_FILTER_H_
#define ASSETSPEED_EMBEDDER_PUBLIC_ASSET_REWRITE_FILTER_H_

#include "assetspeed/embedder/public/asset_types.h"
#include "assetspeed/embedder/public/embedding_stats.h"
#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/html/empty_html_filter.h"

namespace assetspeed {

class HtmlCharactersNode;
class HtmlElement;
class HtmlParse;

// Applies embedding decisions to every reference in a document:
//   inline-data      the URL is replaced by the data: URL.
//   inline-text      an <img> is replaced by the asset's markup.  Inside
//                    CSS there is no element to replace, so the URL stays.
//   delegate-upload  the URL is replaced by the upload location.
//   externalize      the URL stays.
// References to paths without a decision, including data: URLs, are left
// alone.  Text outside the rewritten URLs is not touched.
class AssetRewriteFilter : public EmptyHtmlFilter {
 public:
  AssetRewriteFilter(HtmlParse* html_parse,
                     const AssetDecisionMap* decisions);
  virtual ~AssetRewriteFilter();

  void StartDocument() override;
  void StartElement(HtmlElement* element) override;
  void EndElement(HtmlElement* element) override;
  void Characters(HtmlCharactersNode* characters) override;
  const char* Name() const override { return "AssetRewrite"; }

  // Totals for the last document rewritten.
  const EmbeddingStats& stats() const { return stats_; }

 private:
  class CssUrlRewriter;

  const AssetDecision* FindDecision(StringPiece path) const;
  void RewriteSource(HtmlElement* element, bool can_replace_element);
  // Rewrites the URLs in css into *out.  Returns true if anything changed.
  bool RewriteCss(StringPiece css, HtmlElement* element, GoogleString* out);

  HtmlParse* html_parse_;
  const AssetDecisionMap* decisions_;
  EmbeddingStats stats_;

  DISALLOW_COPY_AND_ASSIGN(AssetRewriteFilter);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_EMBEDDER_PUBLIC_ASSET_REWRITE_FILTER_H_
