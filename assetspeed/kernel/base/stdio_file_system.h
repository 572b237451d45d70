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

#ifndef ASSETSPEED_KERNEL_BASE_STDIO_FILE_SYSTEM_H_
#define ASSETSPEED_KERNEL_BASE_STDIO_FILE_SYSTEM_H_

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

class MessageHandler;

// Whole-file reads and writes via stdio.  Errors are reported to the
// message handler along with strerror(errno).
class StdioFileSystem {
 public:
  StdioFileSystem() {}
  ~StdioFileSystem();

  // Reads the whole file into *buffer.  Returns false if it cannot be
  // opened or read.
  bool ReadFile(const char* filename, GoogleString* buffer,
                MessageHandler* handler);

  // Writes buffer to filename, replacing its contents.  A filename of "-"
  // writes to stdout.
  bool WriteFile(const char* filename, const StringPiece& buffer,
                 MessageHandler* handler);

  // Returns true if filename names an existing regular file.
  bool Exists(const char* filename);

 private:
  DISALLOW_COPY_AND_ASSIGN(StdioFileSystem);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_BASE_STDIO_FILE_SYSTEM_H_
