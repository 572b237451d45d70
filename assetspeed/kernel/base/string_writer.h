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

#ifndef ASSETSPEED_KERNEL_BASE_STRING_WRITER_H_
#define ASSETSPEED_KERNEL_BASE_STRING_WRITER_H_

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/base/writer.h"

namespace assetspeed {
class MessageHandler;

// Writer implementation for directing HTML output to a string.
class StringWriter : public Writer {
 public:
  explicit StringWriter(GoogleString* str) : string_(str) { }
  virtual ~StringWriter();
  bool Write(const StringPiece& str, MessageHandler* message_handler) override;
  bool Flush(MessageHandler* message_handler) override;

 private:
  GoogleString* string_;

  DISALLOW_COPY_AND_ASSIGN(StringWriter);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_BASE_STRING_WRITER_H_
