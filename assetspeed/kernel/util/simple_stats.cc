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

#include "assetspeed/kernel/base/thread_system.h"
#include "assetspeed/kernel/base/writer.h"

namespace assetspeed {

SimpleStatsVariable::SimpleStatsVariable(StringPiece name,
                                         AbstractMutex* mutex)
    : name_(name.as_string()),
      value_(0),
      mutex_(mutex) {
}

SimpleStatsVariable::~SimpleStatsVariable() {
}

int64 SimpleStatsVariable::Get() const {
  ScopedMutex lock(mutex_.get());
  return value_;
}

void SimpleStatsVariable::Set(int64 value) {
  ScopedMutex lock(mutex_.get());
  value_ = value;
}

int64 SimpleStatsVariable::AddHelper(int64 delta) {
  ScopedMutex lock(mutex_.get());
  value_ += delta;
  return value_;
}

SimpleStats::SimpleStats(ThreadSystem* thread_system)
    : thread_system_(thread_system) {
}

SimpleStats::~SimpleStats() {
}

Variable* SimpleStats::AddVariable(StringPiece name) {
  GoogleString key = name.as_string();
  VariableMap::iterator p = variable_map_.find(key);
  if (p != variable_map_.end()) {
    return p->second;
  }
  SimpleStatsVariable* var =
      new SimpleStatsVariable(name, thread_system_->NewMutex());
  variables_.push_back(std::unique_ptr<SimpleStatsVariable>(var));
  variable_map_[key] = var;
  return var;
}

Variable* SimpleStats::FindVariable(StringPiece name) const {
  VariableMap::const_iterator p = variable_map_.find(name.as_string());
  if (p == variable_map_.end()) {
    return NULL;
  }
  return p->second;
}

void SimpleStats::Clear() {
  for (int i = 0, n = variables_.size(); i < n; ++i) {
    variables_[i]->Clear();
  }
}

bool SimpleStats::Dump(Writer* writer, MessageHandler* handler) {
  bool ok = true;
  for (int i = 0, n = variables_.size(); ok && (i < n); ++i) {
    SimpleStatsVariable* var = variables_[i].get();
    ok = writer->Write(StrCat(var->GetName(), ": ",
                              Integer64ToString(var->Get()), "\n"),
                       handler);
  }
  return ok;
}

}  // namespace assetspeed
