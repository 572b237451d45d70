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

#ifndef ASSETSPEED_KERNEL_BASE_THREAD_SYSTEM_H_
#define ASSETSPEED_KERNEL_BASE_THREAD_SYSTEM_H_

#include "assetspeed/kernel/base/basictypes.h"

namespace assetspeed {

class AbstractMutex;

// Interface to the threading primitives available to the embedder.
class ThreadSystem {
 public:
  ThreadSystem() {}
  virtual ~ThreadSystem();

  // Makes a new mutex for this system.
  virtual AbstractMutex* NewMutex() = 0;

 private:
  DISALLOW_COPY_AND_ASSIGN(ThreadSystem);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_BASE_THREAD_SYSTEM_H_
