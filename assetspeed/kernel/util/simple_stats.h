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

#ifndef ASSETSPEED_KERNEL_UTIL_SIMPLE_STATS_H_
#define ASSETSPEED_KERNEL_UTIL_SIMPLE_STATS_H_

#include <map>
#include <memory>
#include <vector>

#include "assetspeed/kernel/base/abstract_mutex.h"
#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/statistics.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

class ThreadSystem;

// These variables are thread-safe.
class SimpleStatsVariable : public Variable {
 public:
  // Takes ownership of the mutex.
  SimpleStatsVariable(StringPiece name, AbstractMutex* mutex);
  virtual ~SimpleStatsVariable();

  int64 Get() const override;
  StringPiece GetName() const override { return name_; }

 protected:
  void Set(int64 value) override;
  int64 AddHelper(int64 delta) override;

 private:
  GoogleString name_;
  int64 value_;
  std::unique_ptr<AbstractMutex> mutex_;

  DISALLOW_COPY_AND_ASSIGN(SimpleStatsVariable);
};

// Simple name/value pair statistics implementation.
class SimpleStats : public Statistics {
 public:
  // SimpleStats will not take ownership of thread_system.  The thread system is
  // used to instantiate mutexes to allow SimpleStatsVariable to be thread-safe.
  explicit SimpleStats(ThreadSystem* thread_system);
  virtual ~SimpleStats();

  Variable* AddVariable(StringPiece name) override;
  Variable* FindVariable(StringPiece name) const override;
  void Clear() override;
  bool Dump(Writer* writer, MessageHandler* handler) override;

 private:
  typedef std::map<GoogleString, SimpleStatsVariable*> VariableMap;

  ThreadSystem* thread_system_;  // Not owned by this class.
  std::vector<std::unique_ptr<SimpleStatsVariable> > variables_;
  VariableMap variable_map_;

  DISALLOW_COPY_AND_ASSIGN(SimpleStats);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_UTIL_SIMPLE_STATS_H_
