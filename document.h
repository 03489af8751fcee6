// -*- mode:c++;indent-tabs-mode:nil;c-basic-offset:4;coding:utf-8 -*-
// vi: set et ft=cpp ts=4 sts=4 sw=4 fenc=utf-8 :vi
//
// Copyright 2024 Mozilla Foundation
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once
#include "json.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace jdoc {

class Document;

// View of one value inside a document's tree.
//
// A node shares ownership of the whole tree, so it stays valid after
// the Document it came from is gone. Copying a node never copies JSON.
class Node
{
  public:
    const Json& value() const
    {
        return *json_;
    }

    // JSONPath-style location, e.g. "$.screenSize.width".
    const std::string& path() const
    {
        return path_;
    }

    Json::Type getType() const
    {
        return json_->getType();
    }

    bool isObject() const
    {
        return json_->isObject();
    }

  private:
    friend class Document;
    friend Node readObject(const Node&, const std::string&);
    friend std::vector<Node> readArrayOfObject(const Node&,
                                               const std::string&);

    Node(std::shared_ptr<const Json> json, std::string path)
      : json_(std::move(json)), path_(std::move(path))
    {
    }

    // Views `value`, which must belong to this node's tree.
    Node child(const Json& value, std::string path) const
    {
        return Node(std::shared_ptr<const Json>(json_, &value),
                    std::move(path));
    }

    std::shared_ptr<const Json> json_;
    std::string path_;
};

// A parsed JSON document plus where it was loaded from.
class Document
{
  public:
    // Throws IoError if the file cannot be read and ParseError if it
    // does not hold well-formed JSON.
    static Document loadFromFile(const std::string& path);

    // Throws ParseError if `text` is not well-formed JSON.
    static Document loadFromText(const std::string& text);

    const Node& root() const
    {
        return root_;
    }

    // The file path, or "<memory>" for text documents.
    const std::string& source() const
    {
        return source_;
    }

    bool isFromFile() const
    {
        return from_file_;
    }

  private:
    Document(Json&& json, std::string source, bool from_file);

    Node root_;
    std::string source_;
    bool from_file_;
};

// Appends a member step to a JSONPath, quoting keys that are not plain
// identifiers.
std::string
AppendKeyToPath(const std::string& path, const std::string& key);

std::string
AppendIndexToPath(const std::string& path, size_t index);

} // namespace jdoc
