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

#include "assetspeed/embedder/public/css_tag_scanner.h"

#include "assetspeed/kernel/base/message_handler.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/base/writer.h"

namespace assetspeed {

CssTagScanner::Transformer::~Transformer() {
}

const char CssTagScanner::kUriValue[] = "url(";

namespace {

// The payload of one url() token.  quote is the delimiter it was written
// with, or 0 when unquoted.
struct UrlToken {
  UrlToken() : quote(0) {}

  GoogleString url;
  char quote;
};

bool IsLineBreak(char c) {
  return c == '\n' || c == '\r' || c == '\f';
}

// Decodes the escape following a backslash onto *out.  Only escapes that
// stand for a single literal character, and line continuations inside
// quotes, are understood; anything else (hex code points) makes the whole
// url() opaque.
bool DecodeEscape(bool quoted, StringPiece* in, GoogleString* out) {
  if (in->empty()) {
    return false;
  }
  char c = (*in)[0];
  in->remove_prefix(1);
  switch (c) {
    case ',': case '"': case '\'': case '\\': case '(': case ')': case ' ':
      out->push_back(c);
      return true;
    case '\r':
      if (in->starts_with("\n")) {
        in->remove_prefix(1);
      }
      return quoted;
    case '\n':
    case '\f':
      return quoted;
    default:
      return false;
  }
}

// Reads up to and including the closing quote.  An unescaped line break or
// the end of input leaves the string unterminated.
bool ReadQuoted(char quote, StringPiece* in, GoogleString* out) {
  while (!in->empty()) {
    char c = (*in)[0];
    if (IsLineBreak(c)) {
      return false;
    }
    in->remove_prefix(1);
    if (c == quote) {
      return true;
    } else if (c == '\\') {
      if (!DecodeEscape(true, in, out)) {
        return false;
      }
    } else {
      out->push_back(c);
    }
  }
  return false;
}

// Reads up to and including ')'.  Whitespace may only appear right before
// the ')'.
bool ReadUnquoted(StringPiece* in, GoogleString* out) {
  while (!in->empty()) {
    char c = (*in)[0];
    in->remove_prefix(1);
    if (c == ')') {
      return true;
    } else if (c == '\\') {
      if (!DecodeEscape(false, in, out)) {
        return false;
      }
    } else if (IsHtmlSpace(c)) {
      TrimLeadingWhitespace(in);
      if (!in->starts_with(")")) {
        return false;
      }
      in->remove_prefix(1);
      return true;
    } else {
      out->push_back(c);
    }
  }
  return false;
}

// Parses what follows "url(" and advances *in past it.  Returns true only
// for a token closed by ')'.
bool ReadUrlToken(StringPiece* in, UrlToken* token) {
  TrimLeadingWhitespace(in);
  if (in->starts_with("'") || in->starts_with("\"")) {
    token->quote = (*in)[0];
    in->remove_prefix(1);
    if (!ReadQuoted(token->quote, in, &token->url)) {
      return false;
    }
    TrimLeadingWhitespace(in);
    if (!in->starts_with(")")) {
      return false;
    }
    in->remove_prefix(1);
    return true;
  }
  return ReadUnquoted(in, &token->url);
}

// Writes token back as url(...), escaping whatever would end it early.
GoogleString SerializeUrlToken(const UrlToken& token) {
  GoogleString out(CssTagScanner::kUriValue);
  if (token.quote != 0) {
    out.push_back(token.quote);
  }
  for (int i = 0, n = token.url.size(); i < n; ++i) {
    char c = token.url[i];
    if (c == '\n') {
      out.append("\\a ");
      continue;
    }
    bool special = (token.quote != 0)
        ? (c == token.quote || c == '\\')
        : (c == '(' || c == ')' || c == '\\' || c == '\'' || c == '"' ||
           c == ' ');
    if (special) {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  if (token.quote != 0) {
    out.push_back(token.quote);
  }
  out.push_back(')');
  return out;
}

}  // namespace

bool CssTagScanner::TransformUrls(
    StringPiece contents, Writer* writer, Transformer* transformer,
    MessageHandler* handler) {
  bool ok = true;
  // Start of the text scanned but not yet written.
  const char* pending = contents.data();
  StringPiece in = contents;
  while (!in.empty()) {
    if (!StringCaseStartsWith(in, kUriValue)) {
      in.remove_prefix(1);
      continue;
    }
    const char* token_begin = in.data();
    in.remove_prefix(STATIC_STRLEN(kUriValue));
    UrlToken token;
    if (!ReadUrlToken(&in, &token)) {
      continue;
    }
    switch (transformer->Transform(&token.url)) {
      case Transformer::kNoChange:
        break;
      case Transformer::kFailure:
        handler->Message(kWarning, "Could not rewrite url(%s)",
                         token.url.c_str());
        return false;
      case Transformer::kSuccess:
        ok = ok && writer->Write(
            StringPiece(pending, token_begin - pending), handler);
        ok = ok && writer->Write(SerializeUrlToken(token), handler);
        pending = in.data();
        break;
    }
  }
  const char* end = contents.data() + contents.size();
  if (pending < end) {
    ok = ok && writer->Write(StringPiece(pending, end - pending), handler);
  }
  return ok;
}

bool CssTagScanner::HasUrl(const StringPiece& contents) {
  GoogleString lower;
  contents.CopyToString(&lower);
  LowerString(&lower);
  return lower.find(kUriValue) != GoogleString::npos;
}

CssUrlCollector::~CssUrlCollector() {
}

CssTagScanner::Transformer::TransformStatus CssUrlCollector::Transform(
    GoogleString* str) {
  urls_->push_back(*str);
  return kNoChange;
}

}  // namespace assetspeed
