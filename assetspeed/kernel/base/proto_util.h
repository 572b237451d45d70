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


#ifndef ASSETSPEED_KERNEL_BASE_PROTO_UTIL_H_
#define ASSETSPEED_KERNEL_BASE_PROTO_UTIL_H_

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"

namespace assetspeed {

namespace protobuf {

// Pulls all google::protobuf namespace into assetspeed::protobuf namespace.
using namespace google::protobuf;  // NOLINT

}  // namespace protobuf

inline bool ParseTextFormatProtoFromString(const GoogleString& s,
                                           protobuf::Message* proto) {
  return google::protobuf::TextFormat::ParseFromString(s, proto);
}

inline bool PrintTextFormatProtoToString(const protobuf::Message& proto,
                                         GoogleString* out) {
  return google::protobuf::TextFormat::PrintToString(proto, out);
}

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_BASE_PROTO_UTIL_H_
