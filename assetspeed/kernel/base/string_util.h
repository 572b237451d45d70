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

#ifndef ASSETSPEED_KERNEL_BASE_STRING_UTIL_H_
#define ASSETSPEED_KERNEL_BASE_STRING_UTIL_H_

#include <cstddef>
#include <map>
#include <set>
#include <vector>

#include "base/logging.h"
#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"

#include "base/strings/string_number_conversions.h"
#include "base/strings/string_piece.h"
#include "base/strings/stringprintf.h"

using base::StringAppendF;
using base::StringAppendV;
using base::StringPiece;
using base::StringPrintf;

// Quick macro to get the size of a static char[] without trailing '\0'.
// Note: Cannot be used for char*, std::string, etc.
#define STATIC_STRLEN(static_string) (arraysize(static_string) - 1)

namespace assetspeed {

typedef std::map<GoogleString, GoogleString> StringStringMap;
typedef std::map<GoogleString, int> StringIntMap;
typedef std::set<GoogleString> StringSet;
typedef std::vector<GoogleString> StringVector;
typedef std::vector<StringPiece> StringPieceVector;

inline GoogleString IntegerToString(int i) {
  return base::IntToString(i);
}

inline GoogleString Integer64ToString(int64 i) {
  return base::Int64ToString(i);
}

// NOTE: For a string of the form "45x", this sets *out = 45 but returns false.
inline bool StringToInt(const GoogleString& in, int* out) {
  return base::StringToInt(in, out);
}

inline bool StringToInt64(const GoogleString& in, int64* out) {
  return base::StringToInt64(in, out);
}

// Parses a valid floating point number and returns true if the string
// contains only that number (ignoring leading/trailing whitespace).
bool StringToDouble(StringPiece in, double* out);

GoogleString StrCat(StringPiece a, StringPiece b);
GoogleString StrCat(StringPiece a, StringPiece b, StringPiece c);
GoogleString StrCat(StringPiece a, StringPiece b, StringPiece c, StringPiece d);
GoogleString StrCat(StringPiece a, StringPiece b, StringPiece c, StringPiece d,
                    StringPiece e);
GoogleString StrCat(StringPiece a, StringPiece b, StringPiece c, StringPiece d,
                    StringPiece e, StringPiece f);

void StrAppend(GoogleString* target, StringPiece a);
void StrAppend(GoogleString* target, StringPiece a, StringPiece b);
void StrAppend(GoogleString* target, StringPiece a, StringPiece b,
               StringPiece c);
void StrAppend(GoogleString* target, StringPiece a, StringPiece b,
               StringPiece c, StringPiece d);

// Split sp into pieces that are separated by any character in the given
// string of separators, and push those pieces in order onto components.
void SplitStringPieceToVector(StringPiece sp, StringPiece separators,
                              StringPieceVector* components,
                              bool omit_empty_strings);

inline char LowerChar(char c) {
  if ((c >= 'A') && (c <= 'Z')) {
    c += 'a' - 'A';
  }
  return c;
}

void LowerString(GoogleString* str);

// Replaces all instances of 'substring' in 's' with 'replacement'.
// Returns the number of instances replaced.
int GlobalReplaceSubstring(StringPiece substring, StringPiece replacement,
                           GoogleString* s);

// Returns true if c is whitespace per the HTML5 definition.
inline bool IsHtmlSpace(char c) {
  return (c == ' ') || (c == '\t') || (c == '\r') || (c == '\n') ||
      (c == '\f');
}

// Removes leading and trailing whitespace.  Returns true if any was removed.
bool TrimWhitespace(StringPiece* str);
bool TrimLeadingWhitespace(StringPiece* str);
bool TrimTrailingWhitespace(StringPiece* str);

// Non-destructive TrimWhitespace.
inline void TrimWhitespace(StringPiece in, GoogleString* output) {
  TrimWhitespace(&in);
  output->assign(in.data(), in.size());
}

bool StringCaseEqual(StringPiece s1, StringPiece s2);
bool StringCaseStartsWith(StringPiece str, StringPiece prefix);
bool StringCaseEndsWith(StringPiece str, StringPiece suffix);

// Renders a byte count for humans: "512B", "4.00KB", "1.50MB".
GoogleString FormatBytes(int64 bytes);

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_BASE_STRING_UTIL_H_
