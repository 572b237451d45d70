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

#ifndef ASSETSPEED_KERNEL_BASE_ABSTRACT_MUTEX_H_
#define ASSETSPEED_KERNEL_BASE_ABSTRACT_MUTEX_H_

#include "assetspeed/kernel/base/basictypes.h"

namespace assetspeed {

// Abstract interface for implementing a mutex.
class AbstractMutex {
 public:
  virtual ~AbstractMutex();
  // Attempt to take mutex, true on success, false if held by another thread.
  virtual bool TryLock() = 0;
  // Block until mutex is available, then take the mutex.
  virtual void Lock() = 0;
  // Release the mutex, permitting a blocked lock operation (if any) to proceed.
  virtual void Unlock() = 0;
};

// Helper class for lexically scoped mutexing.
class ScopedMutex {
 public:
  explicit ScopedMutex(AbstractMutex* mutex) : mutex_(mutex) {
    mutex_->Lock();
  }

  ~ScopedMutex() {
    mutex_->Unlock();
  }

 private:
  AbstractMutex* mutex_;

  DISALLOW_COPY_AND_ASSIGN(ScopedMutex);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_BASE_ABSTRACT_MUTEX_H_
