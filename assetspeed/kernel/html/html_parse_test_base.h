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

// Infrastructure for testing html parsing and rewriting.

#ifndef ASSETSPEED_KERNEL_HTML_HTML_PARSE_TEST_BASE_H_
#define ASSETSPEED_KERNEL_HTML_HTML_PARSE_TEST_BASE_H_

#include <memory>

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/gtest.h"
#include "assetspeed/kernel/base/mock_message_handler.h"
#include "assetspeed/kernel/base/null_mutex.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/base/string_writer.h"
#include "assetspeed/kernel/html/html_parse.h"
#include "assetspeed/kernel/html/html_writer_filter.h"

namespace assetspeed {

class HtmlParseTestBase : public testing::Test {
 protected:
  static const char kTestDomain[];

  HtmlParseTestBase()
      : message_handler_(new NullMutex),
        html_parse_(&message_handler_),
        write_to_string_(&output_buffer_) {
  }
  virtual ~HtmlParseTestBase();

  // To make the tests more concise, we generally omit the <html>...</html>
  // tags bracketing the input.  The libraries don't care about that, so
  // these are added here.
  virtual bool AddHtmlTags() const { return true; }

  GoogleString AddHtmlBody(StringPiece html) const {
    GoogleString ret;
    if (AddHtmlTags()) {
      ret = StrCat("<html><body>\n", html, "</body></html>\n");
    } else {
      html.CopyToString(&ret);
    }
    return ret;
  }

  // Check that the output HTML is correct.
  void ValidateNoChanges(StringPiece case_id, StringPiece html_input) {
    ValidateExpected(case_id, html_input, html_input);
  }

  // The writer filter is added lazily because it must be the last filter.
  void SetupWriter();

  void Parse(StringPiece case_id, StringPiece html_input);

  bool ValidateExpected(StringPiece case_id,
                        StringPiece html_input,
                        StringPiece expected);

  HtmlParse* html_parse() { return &html_parse_; }

  MockMessageHandler message_handler_;
  HtmlParse html_parse_;
  StringWriter write_to_string_;
  GoogleString output_buffer_;
  std::unique_ptr<HtmlWriterFilter> html_writer_filter_;

 private:
  DISALLOW_COPY_AND_ASSIGN(HtmlParseTestBase);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_HTML_HTML_PARSE_TEST_BASE_H_
