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

#include "assetspeed/kernel/html/html_parse_test_base.h"

#include "assetspeed/kernel/base/gtest.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/html/html_parse.h"

namespace assetspeed {

const char HtmlParseTestBase::kTestDomain[] = "http://test.com/";

HtmlParseTestBase::~HtmlParseTestBase() {
}

void HtmlParseTestBase::SetupWriter() {
  output_buffer_.clear();
  if (html_writer_filter_.get() == NULL) {
    html_writer_filter_.reset(new HtmlWriterFilter(html_parse()));
    html_writer_filter_->set_writer(&write_to_string_);
    html_parse()->AddFilter(html_writer_filter_.get());
  }
}

void HtmlParseTestBase::Parse(StringPiece case_id, StringPiece html_input) {
  // We don't add the filter in the constructor because it needs to be the
  // last filter added.
  SetupWriter();
  html_parse()->StartParse(StrCat(kTestDomain, case_id, ".html"));
  html_parse()->ParseText(AddHtmlBody(html_input));
  html_parse()->FinishParse();
}

bool HtmlParseTestBase::ValidateExpected(StringPiece case_id,
                                         StringPiece html_input,
                                         StringPiece expected) {
  Parse(case_id, html_input);
  GoogleString xbody = AddHtmlBody(expected);
  EXPECT_EQ(xbody, output_buffer_) << "Test id:" << case_id;
  bool success = (xbody == output_buffer_);
  output_buffer_.clear();
  return success;
}

}  // namespace assetspeed
