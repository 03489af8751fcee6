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
#include "document.h"
#include "error.h"
#include <string>
#include <vector>

// Typed reads of object members.
//
// Every reader takes an object node and a key. It throws
// NotAnObjectError when `node` is not an object, KeyNotFoundError when
// the key is absent and TypeMismatchError when the member has the
// wrong kind. Readers keep no state between calls.

namespace jdoc {

std::string
readString(const Node& node, const std::string& key);

// Truncates toward zero. Numbers outside the range of long long are a
// TypeMismatchError.
long long
readNumberAsInt(const Node& node, const std::string& key);

double
readNumber(const Node& node, const std::string& key);

bool
readBool(const Node& node, const std::string& key);

// Returns a view sharing the document's tree; nothing is copied.
Node
readObject(const Node& node, const std::string& key);

// Every element must be a string; one bad element fails the read.
std::vector<std::string>
readArrayOfString(const Node& node, const std::string& key);

std::vector<Node>
readArrayOfObject(const Node& node, const std::string& key);

// Never throws.
bool
hasKey(const Node& node, const std::string& key);

} // namespace jdoc
