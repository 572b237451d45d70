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

#include "assetspeed/kernel/base/string_util.h"

#include <cerrno>
#include <cstdlib>

#include "assetspeed/kernel/base/string.h"

namespace assetspeed {

bool StringToDouble(StringPiece in, double* out) {
  TrimWhitespace(&in);
  if (in.empty()) {
    return false;
  }
  GoogleString copy(in.data(), in.size());
  char* endptr;
  errno = 0;
  *out = strtod(copy.c_str(), &endptr);
  if ((errno != 0) || (*endptr != '\0')) {
    *out = 0.0;
    return false;
  }
  return true;
}

GoogleString StrCat(StringPiece a, StringPiece b) {
  GoogleString res;
  res.reserve(a.size() + b.size());
  a.AppendToString(&res);
  b.AppendToString(&res);
  return res;
}

GoogleString StrCat(StringPiece a, StringPiece b, StringPiece c) {
  GoogleString res = StrCat(a, b);
  c.AppendToString(&res);
  return res;
}

GoogleString StrCat(StringPiece a, StringPiece b, StringPiece c,
                    StringPiece d) {
  GoogleString res = StrCat(a, b, c);
  d.AppendToString(&res);
  return res;
}

GoogleString StrCat(StringPiece a, StringPiece b, StringPiece c,
                    StringPiece d, StringPiece e) {
  GoogleString res = StrCat(a, b, c, d);
  e.AppendToString(&res);
  return res;
}

GoogleString StrCat(StringPiece a, StringPiece b, StringPiece c,
                    StringPiece d, StringPiece e, StringPiece f) {
  GoogleString res = StrCat(a, b, c, d, e);
  f.AppendToString(&res);
  return res;
}

void StrAppend(GoogleString* target, StringPiece a) {
  a.AppendToString(target);
}

void StrAppend(GoogleString* target, StringPiece a, StringPiece b) {
  a.AppendToString(target);
  b.AppendToString(target);
}

void StrAppend(GoogleString* target, StringPiece a, StringPiece b,
               StringPiece c) {
  StrAppend(target, a, b);
  c.AppendToString(target);
}

void StrAppend(GoogleString* target, StringPiece a, StringPiece b,
               StringPiece c, StringPiece d) {
  StrAppend(target, a, b, c);
  d.AppendToString(target);
}

void SplitStringPieceToVector(StringPiece sp, StringPiece separators,
                              StringPieceVector* components,
                              bool omit_empty_strings) {
  size_t prev_pos = 0;
  size_t pos = 0;
  while ((pos = sp.find_first_of(separators, pos)) != StringPiece::npos) {
    if (!omit_empty_strings || (pos > prev_pos)) {
      components->push_back(sp.substr(prev_pos, pos - prev_pos));
    }
    ++pos;
    prev_pos = pos;
  }
  if (!omit_empty_strings || (prev_pos < sp.size())) {
    components->push_back(sp.substr(prev_pos));
  }
}

void LowerString(GoogleString* str) {
  for (size_t i = 0; i < str->size(); ++i) {
    (*str)[i] = LowerChar((*str)[i]);
  }
}

int GlobalReplaceSubstring(StringPiece substring, StringPiece replacement,
                           GoogleString* s) {
  CHECK(s != NULL);
  if (s->empty() || substring.empty()) {
    return 0;
  }
  GoogleString tmp;
  int num_replacements = 0;
  size_t pos = 0;
  for (size_t match_pos = s->find(substring.data(), pos, substring.length());
       match_pos != GoogleString::npos;
       pos = match_pos + substring.length(),
           match_pos = s->find(substring.data(), pos, substring.length())) {
    ++num_replacements;
    tmp.append(*s, pos, match_pos - pos);
    replacement.AppendToString(&tmp);
  }
  // If no replacements were made, the original string is left untouched.
  if (num_replacements > 0) {
    tmp.append(*s, pos, s->length() - pos);
    s->swap(tmp);
  }
  return num_replacements;
}

bool TrimLeadingWhitespace(StringPiece* str) {
  size_t n = 0;
  while ((n < str->size()) && IsHtmlSpace((*str)[n])) {
    ++n;
  }
  str->remove_prefix(n);
  return n != 0;
}

bool TrimTrailingWhitespace(StringPiece* str) {
  size_t n = 0;
  while ((n < str->size()) && IsHtmlSpace((*str)[str->size() - 1 - n])) {
    ++n;
  }
  str->remove_suffix(n);
  return n != 0;
}

bool TrimWhitespace(StringPiece* str) {
  // We *must* trim *both* leading and trailing spaces, so we use the
  // non-shortcut bitwise | on the boolean results.
  return TrimLeadingWhitespace(str) | TrimTrailingWhitespace(str);
}

bool StringCaseEqual(StringPiece s1, StringPiece s2) {
  if (s1.size() != s2.size()) {
    return false;
  }
  for (size_t i = 0; i < s1.size(); ++i) {
    if (LowerChar(s1[i]) != LowerChar(s2[i])) {
      return false;
    }
  }
  return true;
}

bool StringCaseStartsWith(StringPiece str, StringPiece prefix) {
  return ((str.size() >= prefix.size()) &&
          StringCaseEqual(prefix, str.substr(0, prefix.size())));
}

bool StringCaseEndsWith(StringPiece str, StringPiece suffix) {
  return ((str.size() >= suffix.size()) &&
          StringCaseEqual(suffix, str.substr(str.size() - suffix.size())));
}

GoogleString FormatBytes(int64 bytes) {
  if (bytes < 1024) {
    return StrCat(Integer64ToString(bytes), "B");
  } else if (bytes < 1024 * 1024) {
    return StringPrintf("%.2fKB", bytes / 1024.0);
  }
  return StringPrintf("%.2fMB", bytes / (1024.0 * 1024.0));
}

}  // namespace assetspeed
