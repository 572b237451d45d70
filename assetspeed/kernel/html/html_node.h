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

#ifndef ASSETSPEED_KERNEL_HTML_HTML_NODE_H_
#define ASSETSPEED_KERNEL_HTML_HTML_NODE_H_

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

class HtmlElement;
class HtmlFilter;

// Base class for HtmlElement and HtmlLeafNode.  Nodes are owned by their
// parent element, and ultimately by the HtmlParse that built them.
class HtmlNode {
 public:
  virtual ~HtmlNode();

  // The parent of a node is NULL only for the document root.
  HtmlElement* parent() const { return parent_; }

  // Invokes the filter callbacks for this node, and for an element, its
  // whole subtree in document order.
  virtual void ApplyFilter(HtmlFilter* filter) = 0;

  // Appends the markup for this node (and its subtree) to buf.
  virtual void AppendMarkup(GoogleString* buf) const = 0;

 protected:
  explicit HtmlNode(HtmlElement* parent) : parent_(parent) {}

 private:
  friend class HtmlElement;
  friend class HtmlParse;

  void set_parent(HtmlElement* parent) { parent_ = parent; }

  HtmlElement* parent_;

  DISALLOW_COPY_AND_ASSIGN(HtmlNode);
};

// Shared base class for the text-bearing nodes.  The contents are kept
// exactly as they appeared in the source.
class HtmlLeafNode : public HtmlNode {
 public:
  virtual ~HtmlLeafNode();

  const GoogleString& contents() const { return contents_; }
  void set_contents(const StringPiece& c) { c.CopyToString(&contents_); }

 protected:
  HtmlLeafNode(HtmlElement* parent, const StringPiece& contents);

 private:
  GoogleString contents_;

  DISALLOW_COPY_AND_ASSIGN(HtmlLeafNode);
};

// Leaf node representing raw characters in HTML, including the bodies of
// <style> and <script> blocks.
class HtmlCharactersNode : public HtmlLeafNode {
 public:
  virtual ~HtmlCharactersNode();
  void ApplyFilter(HtmlFilter* filter) override;
  void AppendMarkup(GoogleString* buf) const override;

 private:
  friend class HtmlParse;

  HtmlCharactersNode(HtmlElement* parent, const StringPiece& contents)
      : HtmlLeafNode(parent, contents) {}

  DISALLOW_COPY_AND_ASSIGN(HtmlCharactersNode);
};

// Leaf node representing an HTML comment.  contents() excludes the
// delimiters.
class HtmlCommentNode : public HtmlLeafNode {
 public:
  virtual ~HtmlCommentNode();
  void ApplyFilter(HtmlFilter* filter) override;
  void AppendMarkup(GoogleString* buf) const override;

 private:
  friend class HtmlParse;

  HtmlCommentNode(HtmlElement* parent, const StringPiece& contents,
                  bool terminated)
      : HtmlLeafNode(parent, contents), terminated_(terminated) {}

  bool terminated_;

  DISALLOW_COPY_AND_ASSIGN(HtmlCommentNode);
};

// Leaf node representing an HTML directive such as <!doctype html> or an
// XML processing instruction.  contents() excludes the angle brackets.
class HtmlDirectiveNode : public HtmlLeafNode {
 public:
  virtual ~HtmlDirectiveNode();
  void ApplyFilter(HtmlFilter* filter) override;
  void AppendMarkup(GoogleString* buf) const override;

 private:
  friend class HtmlParse;

  HtmlDirectiveNode(HtmlElement* parent, const StringPiece& contents)
      : HtmlLeafNode(parent, contents) {}

  DISALLOW_COPY_AND_ASSIGN(HtmlDirectiveNode);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_HTML_HTML_NODE_H_
