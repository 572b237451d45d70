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

#include "assetspeed/kernel/base/base64_util.h"

#include "base/base64.h"

namespace assetspeed {

void Mime64Encode(const StringPiece& in, GoogleString* out) {
  base::Base64Encode(in, out);
}

bool Mime64Decode(const StringPiece& in, GoogleString* out) {
  return base::Base64Decode(in, out);
}

}  // namespace assetspeed
