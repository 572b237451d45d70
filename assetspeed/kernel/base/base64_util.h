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

#ifndef ASSETSPEED_KERNEL_BASE_BASE64_UTIL_H_
#define ASSETSPEED_KERNEL_BASE_BASE64_UTIL_H_

#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

// Standard MIME base64 ('+' and '/', '=' padded), as required in data: URLs.
void Mime64Encode(const StringPiece& in, GoogleString* out);

// Returns false if 'in' is not valid base64.
bool Mime64Decode(const StringPiece& in, GoogleString* out);

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_BASE_BASE64_UTIL_H_
