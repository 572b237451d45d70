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

#ifndef ASSETSPEED_KERNEL_HTML_HTML_PARSE_H_
#define ASSETSPEED_KERNEL_HTML_HTML_PARSE_H_

#include <memory>
#include <vector>

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/html/html_name.h"

namespace assetspeed {

class HtmlCharactersNode;
class HtmlCommentNode;
class HtmlDirectiveNode;
class HtmlElement;
class HtmlFilter;
class HtmlNode;
class MessageHandler;

// Builds a document tree from HTML text and runs filters over it.  The
// tree keeps the source text of every tag, so a document that no filter
// modifies serializes back byte-for-byte.
class HtmlParse {
 public:
  explicit HtmlParse(MessageHandler* message_handler);
  virtual ~HtmlParse();

  // Application methods for parsing functions and adding filters

  // Add a new html filter to the filter-chain, without taking ownership
  // of it.  Filters run in the order added, each over the whole document.
  void AddFilter(HtmlFilter* filter);

  // Initiate a chunked parsing session.  Finish with FinishParse.  The
  // url is only used to identify the document in diagnostics.
  bool StartParse(const StringPiece& url);

  // Parses an arbitrary block of an html file, queuing up the text.
  void ParseText(const StringPiece& text);

  // Builds the tree from the queued text and runs every added filter
  // over it in order.
  void FinishParse();

  // Runs a single filter over the current document: StartDocument, the
  // node callbacks in document order, then EndDocument.
  void ApplyFilter(HtmlFilter* filter);

  // Utility methods for implementing filters

  HtmlCharactersNode* NewCharactersNode(HtmlElement* parent,
                                        const StringPiece& literal);
  HtmlElement* NewElement(HtmlElement* parent, const HtmlName& name);
  HtmlName MakeName(HtmlName::Keyword keyword) const;

  // Appends new_node as the last child of parent, taking ownership.
  void AppendChild(HtmlElement* parent, HtmlNode* new_node);

  // Replace existing_node with new_node, taking ownership of new_node.
  // The replaced node (and its subtree) stays allocated until the parser
  // is cleared, so it is safe to call this on the element currently being
  // visited.  Returns false if existing_node is not in the tree.
  bool ReplaceNode(HtmlNode* existing_node, HtmlNode* new_node);

  // The invisible element holding the top-level nodes of the document.
  HtmlElement* root() { return root_.get(); }

  const GoogleString& url() const { return url_; }
  MessageHandler* message_handler() const { return message_handler_; }

  // Drops the document tree, text and url.  Filters stay registered.
  void Clear();

 private:
  friend class HtmlLexer;

  HtmlCommentNode* NewCommentNode(HtmlElement* parent,
                                  const StringPiece& contents,
                                  bool terminated);
  HtmlDirectiveNode* NewDirectiveNode(HtmlElement* parent,
                                      const StringPiece& contents);

  std::vector<HtmlFilter*> filters_;
  std::unique_ptr<HtmlElement> root_;
  std::vector<std::unique_ptr<HtmlNode> > dead_nodes_;
  GoogleString url_;
  GoogleString text_;
  MessageHandler* message_handler_;

  DISALLOW_COPY_AND_ASSIGN(HtmlParse);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_HTML_HTML_PARSE_H_
