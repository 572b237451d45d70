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


#include "assetspeed/kernel/util/simple_stats.h"

#include "assetspeed/kernel/base/gtest.h"
#include "assetspeed/kernel/base/mock_message_handler.h"
#include "assetspeed/kernel/base/null_mutex.h"
#include "assetspeed/kernel/base/null_thread_system.h"
#include "assetspeed/kernel/base/statistics.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_writer.h"

namespace assetspeed {

namespace {

class SimpleStatsTest : public testing::Test {
 protected:
  SimpleStatsTest() : stats_(&thread_system_), handler_(new NullMutex) {}

  NullThreadSystem thread_system_;
  SimpleStats stats_;
  MockMessageHandler handler_;
};

TEST_F(SimpleStatsTest, AddAndFind) {
  Variable* documents = stats_.AddVariable("documents");
  EXPECT_EQ(documents, stats_.AddVariable("documents"));
  EXPECT_EQ(documents, stats_.FindVariable("documents"));
  EXPECT_EQ(documents, stats_.GetVariable("documents"));
  EXPECT_TRUE(stats_.FindVariable("missing") == NULL);
  EXPECT_EQ("documents", documents->GetName());
  EXPECT_EQ(0, documents->Get());
  documents->Add(2);
  documents->Add(3);
  EXPECT_EQ(5, documents->Get());
}

TEST_F(SimpleStatsTest, Clear) {
  Variable* inlined = stats_.AddVariable("inlined");
  inlined->Add(7);
  stats_.Clear();
  EXPECT_EQ(0, inlined->Get());
}

TEST_F(SimpleStatsTest, DumpInCreationOrder) {
  stats_.AddVariable("b")->Add(1);
  stats_.AddVariable("a")->Add(2);
  GoogleString out;
  StringWriter writer(&out);
  EXPECT_TRUE(stats_.Dump(&writer, &handler_));
  EXPECT_EQ("b: 1\na: 2\n", out);
}

}  // namespace

}  // namespace assetspeed
