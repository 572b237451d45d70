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


#include "assetspeed/kernel/util/gflags.h"

#include "base/logging.h"

namespace assetspeed {

void ParseGflags(const char* progname, const char* usage, int* argc,
                 char*** argv) {
  google::SetUsageMessage(usage);
  google::ParseCommandLineFlags(argc, argv, true);
  VLOG(1) << progname << ": parsed command line";
}

bool WasFlagSet(const char* name) {
  google::CommandLineFlagInfo info;
  CHECK(google::GetCommandLineFlagInfo(name, &info)) << "No flag " << name;
  return !info.is_default;
}

}  // namespace assetspeed
