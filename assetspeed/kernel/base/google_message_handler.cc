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

#include "assetspeed/kernel/base/google_message_handler.h"

#include "base/logging.h"

namespace assetspeed {

void GoogleMessageHandler::MessageSImpl(MessageType type,
                                        const GoogleString& message) {
  switch (type) {
    case kInfo:
      LOG(INFO) << message;
      break;
    case kWarning:
      LOG(WARNING) << message;
      break;
    case kError:
      LOG(ERROR) << message;
      break;
    case kFatal:
      LOG(FATAL) << message;
      break;
  }
}

void GoogleMessageHandler::FileMessageSImpl(MessageType type,
                                            const char* file, int line,
                                            const GoogleString& message) {
  switch (type) {
    case kInfo:
      LOG(INFO) << file << ":" << line << ": " << message;
      break;
    case kWarning:
      LOG(WARNING) << file << ":" << line << ": " << message;
      break;
    case kError:
      LOG(ERROR) << file << ":" << line << ": " << message;
      break;
    case kFatal:
      LOG(FATAL) << file << ":" << line << ": " << message;
      break;
  }
}

}  // namespace assetspeed
