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

#ifndef ASSETSPEED_KERNEL_BASE_STATISTICS_H_
#define ASSETSPEED_KERNEL_BASE_STATISTICS_H_

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

class MessageHandler;
class Writer;

// A named, monotonically updated counter.
class Variable {
 public:
  virtual ~Variable();

  virtual int64 Get() const = 0;
  // Never returns NULL.
  virtual StringPiece GetName() const = 0;

  // Adds 'delta' to the variable's value, returning the result.
  int64 Add(int64 delta) { return AddHelper(delta); }
  void Clear() { Set(0); }

 protected:
  virtual void Set(int64 value) = 0;
  virtual int64 AddHelper(int64 delta) = 0;
};

// Base class for implementations of monitoring statistics.
class Statistics {
 public:
  Statistics() {}
  virtual ~Statistics();

  // Add a new variable, or returns an existing one of that name.
  // The Variable* is owned by the Statistics class -- it should
  // not be deleted by the caller.
  virtual Variable* AddVariable(StringPiece name) = 0;

  // Find a variable from a name, returning NULL if not found.
  virtual Variable* FindVariable(StringPiece name) const = 0;

  // Find a variable from a name, aborting if not found.
  Variable* GetVariable(StringPiece name) const;

  // Set all variables to 0.
  virtual void Clear() = 0;

  // Writes "name: value" lines for every variable, in registration order.
  virtual bool Dump(Writer* writer, MessageHandler* handler) = 0;

 private:
  DISALLOW_COPY_AND_ASSIGN(Statistics);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_BASE_STATISTICS_H_
