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

#include "assetspeed/kernel/html/html_keywords.h"

#include <cstdlib>

#include "assetspeed/kernel/base/basictypes.h"

namespace assetspeed {

namespace {

struct EntityPair {
  const char* name;
  char value;
};

const EntityPair kEntities[] = {
  {"amp", '&'},
  {"apos", '\''},
  {"gt", '>'},
  {"lt", '<'},
  {"quot", '"'},
};

// Appends the UTF-8 encoding of code_point to buf.
void AppendUtf8(unsigned int code_point, GoogleString* buf) {
  if (code_point < 0x80) {
    *buf += static_cast<char>(code_point);
  } else if (code_point < 0x800) {
    *buf += static_cast<char>(0xc0 | (code_point >> 6));
    *buf += static_cast<char>(0x80 | (code_point & 0x3f));
  } else if (code_point < 0x10000) {
    *buf += static_cast<char>(0xe0 | (code_point >> 12));
    *buf += static_cast<char>(0x80 | ((code_point >> 6) & 0x3f));
    *buf += static_cast<char>(0x80 | (code_point & 0x3f));
  } else {
    *buf += static_cast<char>(0xf0 | (code_point >> 18));
    *buf += static_cast<char>(0x80 | ((code_point >> 12) & 0x3f));
    *buf += static_cast<char>(0x80 | ((code_point >> 6) & 0x3f));
    *buf += static_cast<char>(0x80 | (code_point & 0x3f));
  }
}

// Decodes the entity body between '&' and ';'.  Returns false if it is not
// one we understand.
bool DecodeEntity(const StringPiece& entity, GoogleString* buf) {
  if (entity.size() > 1 && entity[0] == '#') {
    GoogleString digits;
    int base = 10;
    if ((entity[1] == 'x') || (entity[1] == 'X')) {
      base = 16;
      entity.substr(2).CopyToString(&digits);
    } else {
      entity.substr(1).CopyToString(&digits);
    }
    if (digits.empty() || digits.size() > 8) {
      return false;
    }
    char* end = NULL;
    unsigned long code_point = strtoul(digits.c_str(), &end, base);  // NOLINT
    if ((*end != '\0') || (code_point == 0) || (code_point > 0x10ffff)) {
      return false;
    }
    AppendUtf8(static_cast<unsigned int>(code_point), buf);
    return true;
  }
  for (int i = 0, n = arraysize(kEntities); i < n; ++i) {
    if (entity == kEntities[i].name) {
      *buf += kEntities[i].value;
      return true;
    }
  }
  return false;
}

}  // namespace

void HtmlKeywords::Escape(const StringPiece& unescaped, GoogleString* buf) {
  buf->clear();
  for (size_t i = 0; i < unescaped.size(); ++i) {
    char c = unescaped[i];
    switch (c) {
      case '&':  *buf += "&amp;";  break;
      case '<':  *buf += "&lt;";   break;
      case '>':  *buf += "&gt;";   break;
      case '"':  *buf += "&quot;"; break;
      case '\'': *buf += "&#39;";  break;
      default:   *buf += c;        break;
    }
  }
}

void HtmlKeywords::Unescape(const StringPiece& escaped, GoogleString* buf) {
  buf->clear();
  size_t i = 0;
  while (i < escaped.size()) {
    char c = escaped[i];
    if (c == '&') {
      size_t semi = escaped.find(';', i + 1);
      if ((semi != StringPiece::npos) &&
          DecodeEntity(escaped.substr(i + 1, semi - i - 1), buf)) {
        i = semi + 1;
        continue;
      }
    }
    *buf += c;
    ++i;
  }
}

bool HtmlKeywords::IsVoidElement(HtmlName::Keyword keyword) {
  switch (keyword) {
    case HtmlName::kArea:
    case HtmlName::kBase:
    case HtmlName::kBr:
    case HtmlName::kCol:
    case HtmlName::kEmbed:
    case HtmlName::kHr:
    case HtmlName::kImg:
    case HtmlName::kInput:
    case HtmlName::kLink:
    case HtmlName::kMeta:
    case HtmlName::kParam:
    case HtmlName::kSource:
    case HtmlName::kTrack:
    case HtmlName::kWbr:
      return true;
    default:
      return false;
  }
}

bool HtmlKeywords::IsRawTextElement(HtmlName::Keyword keyword) {
  switch (keyword) {
    case HtmlName::kScript:
    case HtmlName::kStyle:
    case HtmlName::kTextarea:
    case HtmlName::kTitle:
    case HtmlName::kXmp:
      return true;
    default:
      return false;
  }
}

}  // namespace assetspeed
