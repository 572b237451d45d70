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

#ifndef ASSETSPEED_KERNEL_BASE_MOCK_MESSAGE_HANDLER_H_
#define ASSETSPEED_KERNEL_BASE_MOCK_MESSAGE_HANDLER_H_

#include <map>
#include <memory>

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/google_message_handler.h"
#include "assetspeed/kernel/base/message_handler.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

class AbstractMutex;
class Writer;

// A version of GoogleMessageHandler to use in testcases that keeps
// track of number of messages output, to validate diagnostics
class MockMessageHandler : public MessageHandler {
 public:
  // Takes ownership of the mutex.
  explicit MockMessageHandler(AbstractMutex* mutex);

  virtual ~MockMessageHandler();

  // Returns number of messages of given type issued
  int MessagesOfType(MessageType type) const;

  // Returns total number of messages issued
  int TotalMessages() const;

  // Returns number of messages of severity higher than info
  int SeriousMessages() const;

  // If a message contains any of the added patterns (sub-strings),
  // it will not be printed, but will still be counted.
  void AddPatternToSkipPrinting(const char* pattern);

  // Writes every message seen so far, one per line.  Returns false if
  // there were none.
  bool Dump(Writer* writer);

 protected:
  void MessageSImpl(MessageType type, const GoogleString& message) override;
  void FileMessageSImpl(MessageType type, const char* filename,
                        int line, const GoogleString& message) override;

 private:
  typedef std::map<MessageType, int> MessageCountMap;

  // Returns whether the message should be printed.
  bool ShouldPrintMessage(const StringPiece& msg) const;

  // The Impl versions don't grab the lock themselves
  int TotalMessagesImpl() const;
  int MessagesOfTypeImpl(MessageType type) const;

  std::unique_ptr<AbstractMutex> mutex_;
  MessageCountMap message_counts_;
  StringVector patterns_to_skip_;
  GoogleString buffer_;
  // This handler is only for internal use in Dump method.
  GoogleMessageHandler internal_handler_;

  DISALLOW_COPY_AND_ASSIGN(MockMessageHandler);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_BASE_MOCK_MESSAGE_HANDLER_H_
