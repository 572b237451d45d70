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


#ifndef ASSETSPEED_KERNEL_UTIL_GFLAGS_H_
#define ASSETSPEED_KERNEL_UTIL_GFLAGS_H_

#include "gflags/gflags.h"

namespace assetspeed {

// Sets the usage message and parses the command line, removing the
// recognized flags from argv.
void ParseGflags(const char* progname, const char* usage, int* argc,
                 char*** argv);

// True if the named flag was given on the command line.
bool WasFlagSet(const char* name);

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_UTIL_GFLAGS_H_
