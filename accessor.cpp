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

#include "accessor.h"

#include <cmath>

namespace jdoc {

// 2**63, the first double past the range of long long.
static const double kLongLimit = 9223372036854775808.0;

static const Json&
GetMember(const Node& node, const std::string& key)
{
    if (!node.isObject())
        throw NotAnObjectError(node.path(), node.getType());
    const Json* member = node.value().find(key);
    if (!member)
        throw KeyNotFoundError(node.path(), key);
    return *member;
}

static const Json&
GetMember(const Node& node, const std::string& key, Json::Type type)
{
    const Json& member = GetMember(node, key);
    if (member.getType() != type)
        throw TypeMismatchError(AppendKeyToPath(node.path(), key),
                                key,
                                Json::TypeToString(type),
                                Json::TypeToString(member.getType()));
    return member;
}

// Checks every element before the caller copies anything, so a bad
// element never leaves a partial result behind.
static const std::vector<Json>&
GetArrayOf(const Node& node, const std::string& key, Json::Type type)
{
    const std::vector<Json>& array =
      GetMember(node, key, Json::Array).getArray();
    for (size_t i = 0; i < array.size(); ++i) {
        if (array[i].getType() != type) {
            std::string expected = "array of ";
            expected += Json::TypeToString(type);
            throw TypeMismatchError(
              AppendIndexToPath(AppendKeyToPath(node.path(), key), i),
              key,
              expected,
              Json::TypeToString(array[i].getType()));
        }
    }
    return array;
}

std::string
readString(const Node& node, const std::string& key)
{
    return GetMember(node, key, Json::String).getString();
}

long long
readNumberAsInt(const Node& node, const std::string& key)
{
    double x = GetMember(node, key, Json::Number).getNumber();
    double t = std::trunc(x);
    if (!(-kLongLimit <= t && t < kLongLimit))
        throw TypeMismatchError(AppendKeyToPath(node.path(), key),
                                key,
                                "integer",
                                "number out of integer range");
    return static_cast<long long>(t);
}

double
readNumber(const Node& node, const std::string& key)
{
    return GetMember(node, key, Json::Number).getNumber();
}

bool
readBool(const Node& node, const std::string& key)
{
    return GetMember(node, key, Json::Bool).getBool();
}

Node
readObject(const Node& node, const std::string& key)
{
    const Json& member = GetMember(node, key, Json::Object);
    return node.child(member, AppendKeyToPath(node.path(), key));
}

std::vector<std::string>
readArrayOfString(const Node& node, const std::string& key)
{
    const std::vector<Json>& array = GetArrayOf(node, key, Json::String);
    std::vector<std::string> res;
    res.reserve(array.size());
    for (const Json& element : array)
        res.push_back(element.getString());
    return res;
}

std::vector<Node>
readArrayOfObject(const Node& node, const std::string& key)
{
    const std::vector<Json>& array = GetArrayOf(node, key, Json::Object);
    std::string path = AppendKeyToPath(node.path(), key);
    std::vector<Node> res;
    res.reserve(array.size());
    for (size_t i = 0; i < array.size(); ++i)
        res.push_back(node.child(array[i], AppendIndexToPath(path, i)));
    return res;
}

bool
hasKey(const Node& node, const std::string& key)
{
    return node.value().contains(key);
}

} // namespace jdoc
