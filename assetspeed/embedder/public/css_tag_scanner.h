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


#ifndef ASSETSPEED_EMBEDDER_PUBLIC_CSS_TAG_SCANNER_H_
#define ASSETSPEED_EMBEDDER_PUBLIC_CSS_TAG_SCANNER_H_

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

class MessageHandler;
class Writer;

// Finds the url() tokens in style text, which is where stylesheets and
// style attributes reference images and fonts.
class CssTagScanner {
 public:
  // Receives each decoded URL found by TransformUrls.
  class Transformer {
   public:
    virtual ~Transformer();

    enum TransformStatus { kSuccess, kNoChange, kFailure };

    // kSuccess: *str was replaced and the token is rewritten with it.
    // kNoChange: the token's original bytes are kept.
    // kFailure: scanning stops and TransformUrls returns false.
    virtual TransformStatus Transform(GoogleString* str) = 0;
  };

  static const char kUriValue[];

  // Offers every complete url(...) token in contents to transformer, in
  // order, and writes contents to writer with the replaced tokens
  // re-serialized in their original quote style.  Unterminated tokens and
  // tokens with escapes that cannot be decoded are copied through and
  // never offered.  Returns false if the transformer or the writer failed.
  static bool TransformUrls(StringPiece contents, Writer* writer,
                            Transformer* transformer,
                            MessageHandler* handler);

  // Cheap check for whether contents has any url( at all.
  static bool HasUrl(const StringPiece& contents);

 private:
  DISALLOW_COPY_AND_ASSIGN(CssTagScanner);
};

// Transformer that records every URL it is offered, leaving the CSS alone.
class CssUrlCollector : public CssTagScanner::Transformer {
 public:
  explicit CssUrlCollector(StringVector* urls) : urls_(urls) {}
  virtual ~CssUrlCollector();

  TransformStatus Transform(GoogleString* str) override;

 private:
  StringVector* urls_;

  DISALLOW_COPY_AND_ASSIGN(CssUrlCollector);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_EMBEDDER_PUBLIC_CSS_TAG_SCANNER_H_
