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

#include "assetspeed/kernel/base/mock_message_handler.h"

#include <map>

#include "assetspeed/kernel/base/abstract_mutex.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/base/writer.h"

namespace assetspeed {

MockMessageHandler::MockMessageHandler(AbstractMutex* mutex)
    : mutex_(mutex) {
}

MockMessageHandler::~MockMessageHandler() {
}

void MockMessageHandler::MessageSImpl(MessageType type,
                                      const GoogleString& message) {
  ScopedMutex hold_mutex(mutex_.get());
  if (ShouldPrintMessage(message)) {
    internal_handler_.MessageSImpl(type, message);
  }
  StrAppend(&buffer_, "[", MessageTypeToString(type), "] ", message);
  buffer_ += '\n';
  ++message_counts_[type];
}

void MockMessageHandler::FileMessageSImpl(MessageType type,
                                          const char* filename, int line,
                                          const GoogleString& message) {
  ScopedMutex hold_mutex(mutex_.get());
  if (ShouldPrintMessage(message)) {
    internal_handler_.FileMessageSImpl(type, filename, line, message);
  }
  StrAppend(&buffer_, "[", MessageTypeToString(type), "] ");
  StrAppend(&buffer_, "[", filename, ":", IntegerToString(line));
  StrAppend(&buffer_, "] ", message);
  buffer_ += '\n';
  ++message_counts_[type];
}

int MockMessageHandler::MessagesOfType(MessageType type) const {
  ScopedMutex hold_mutex(mutex_.get());
  return MessagesOfTypeImpl(type);
}

int MockMessageHandler::MessagesOfTypeImpl(MessageType type) const {
  MessageCountMap::const_iterator i = message_counts_.find(type);
  if (i != message_counts_.end()) {
    return i->second;
  } else {
    return 0;
  }
}

int MockMessageHandler::TotalMessages() const {
  ScopedMutex hold_mutex(mutex_.get());
  return TotalMessagesImpl();
}

int MockMessageHandler::TotalMessagesImpl() const {
  int total = 0;
  for (MessageCountMap::const_iterator i = message_counts_.begin();
       i != message_counts_.end(); ++i) {
    total += i->second;
  }
  return total;
}

int MockMessageHandler::SeriousMessages() const {
  ScopedMutex hold_mutex(mutex_.get());
  return TotalMessagesImpl() - MessagesOfTypeImpl(kInfo);
}

void MockMessageHandler::AddPatternToSkipPrinting(const char* pattern) {
  ScopedMutex hold_mutex(mutex_.get());
  patterns_to_skip_.push_back(pattern);
}

bool MockMessageHandler::ShouldPrintMessage(const StringPiece& msg) const {
  for (int i = 0, n = patterns_to_skip_.size(); i < n; ++i) {
    if (msg.find(patterns_to_skip_[i]) != StringPiece::npos) {
      return false;
    }
  }
  return true;
}

bool MockMessageHandler::Dump(Writer* writer) {
  ScopedMutex hold_mutex(mutex_.get());
  if (buffer_.empty()) {
    return false;
  }
  return writer->Write(buffer_, &internal_handler_);
}

}  // namespace assetspeed
