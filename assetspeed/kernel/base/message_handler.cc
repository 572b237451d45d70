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

#include "assetspeed/kernel/base/message_handler.h"

#include <cstdarg>

#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

MessageHandler::MessageHandler() : min_message_type_(kInfo) {
}

MessageHandler::~MessageHandler() {
}

const char* MessageHandler::MessageTypeToString(const MessageType type) const {
  const char* type_string = NULL;

  if (type == kInfo) {
    type_string = "Info";
  } else if (type == kWarning) {
    type_string = "Warning";
  } else if (type == kError) {
    type_string = "Error";
  } else {
    type_string = "Fatal";
  }

  return type_string;
}

void MessageHandler::Message(MessageType type, const char* msg, ...) {
  va_list args;
  va_start(args, msg);
  MessageV(type, msg, args);
  va_end(args);
}

void MessageHandler::MessageV(MessageType type, const char* msg,
                              va_list args) {
  if (type >= min_message_type_) {
    GoogleString buffer;
    StringAppendV(&buffer, msg, args);
    MessageSImpl(type, buffer);
  }
}

void MessageHandler::FileMessage(MessageType type, const char* file, int line,
                                 const char* msg, ...) {
  va_list args;
  va_start(args, msg);
  FileMessageV(type, file, line, msg, args);
  va_end(args);
}

void MessageHandler::FileMessageV(MessageType type, const char* filename,
                                  int line, const char* msg, va_list args) {
  if (type >= min_message_type_) {
    GoogleString buffer;
    StringAppendV(&buffer, msg, args);
    FileMessageSImpl(type, filename, line, buffer);
  }
}

void MessageHandler::Info(const char* file, int line, const char* msg, ...) {
  va_list args;
  va_start(args, msg);
  FileMessageV(kInfo, file, line, msg, args);
  va_end(args);
}

void MessageHandler::Warning(const char* file, int line,
                             const char* msg, ...) {
  va_list args;
  va_start(args, msg);
  FileMessageV(kWarning, file, line, msg, args);
  va_end(args);
}

void MessageHandler::Error(const char* file, int line, const char* msg, ...) {
  va_list args;
  va_start(args, msg);
  FileMessageV(kError, file, line, msg, args);
  va_end(args);
}

void MessageHandler::FatalError(const char* file, int line,
                                const char* msg, ...) {
  va_list args;
  va_start(args, msg);
  FileMessageV(kFatal, file, line, msg, args);
  va_end(args);
}

void MessageHandler::MessageS(MessageType type, const GoogleString& message) {
  if (type >= min_message_type_) {
    MessageSImpl(type, message);
  }
}

}  // namespace assetspeed
