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

#include "assetspeed/kernel/base/stdio_file_system.h"

#include <sys/stat.h>
#include <cerrno>
#include <cstdio>
#include <cstring>

#include "assetspeed/kernel/base/message_handler.h"

namespace assetspeed {

StdioFileSystem::~StdioFileSystem() {
}

bool StdioFileSystem::ReadFile(const char* filename, GoogleString* buffer,
                               MessageHandler* handler) {
  FILE* f = fopen(filename, "rb");
  if (f == NULL) {
    handler->Error(filename, 0, "opening input file: %s", strerror(errno));
    return false;
  }
  bool ret = false;
  struct stat statbuf;
  if (fstat(fileno(f), &statbuf) < 0) {
    handler->Error(filename, 0, "stating file: %s", strerror(errno));
  } else {
    buffer->resize(statbuf.st_size);
    size_t nread = (statbuf.st_size == 0) ? 0 :
        fread(&(*buffer)[0], 1, statbuf.st_size, f);
    if (nread != static_cast<size_t>(statbuf.st_size)) {
      handler->Error(filename, 0, "reading file: %s", strerror(errno));
    } else {
      ret = true;
    }
  }
  if (fclose(f) != 0) {
    handler->Error(filename, 0, "closing file: %s", strerror(errno));
    ret = false;
  }
  return ret;
}

bool StdioFileSystem::WriteFile(const char* filename,
                                const StringPiece& buffer,
                                MessageHandler* handler) {
  bool to_stdout = (strcmp(filename, "-") == 0);
  FILE* f = to_stdout ? stdout : fopen(filename, "wb");
  if (f == NULL) {
    handler->Error(filename, 0, "opening output file: %s", strerror(errno));
    return false;
  }
  bool ret = true;
  size_t nwritten = fwrite(buffer.data(), 1, buffer.size(), f);
  if (nwritten != buffer.size()) {
    handler->Error(filename, 0, "writing file: %s", strerror(errno));
    ret = false;
  }
  if (to_stdout) {
    if (fflush(f) != 0) {
      handler->Error(filename, 0, "flushing stdout: %s", strerror(errno));
      ret = false;
    }
  } else if (fclose(f) != 0) {
    handler->Error(filename, 0, "closing file: %s", strerror(errno));
    ret = false;
  }
  return ret;
}

bool StdioFileSystem::Exists(const char* filename) {
  struct stat statbuf;
  return (stat(filename, &statbuf) == 0) && S_ISREG(statbuf.st_mode);
}

}  // namespace assetspeed
