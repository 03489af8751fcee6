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

#include "document.h"
#include "error.h"

#include <cerrno>
#include <cstdio>

namespace jdoc {

static const char kMemorySource[] = "<memory>";

static std::string
ReadTextFile(const std::string& path)
{
    std::unique_ptr<FILE, int (*)(FILE*)> f(fopen(path.c_str(), "rb"), fclose);
    if (!f)
        throw IoError(path, errno);
    std::string b;
    char buf[16384];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), f.get())) > 0)
        b.append(buf, n);
    if (ferror(f.get()))
        throw IoError(path, errno ? errno : EIO);
    return b;
}

static Json
ParseText(const std::string& source, const std::string& text)
{
    Json json;
    size_t offset = 0;
    Json::Status status = Json::parse(text, json, &offset);
    if (status != Json::success)
        throw ParseError::at(source, text, status, offset);
    return json;
}

static bool
IsIdentifier(const std::string& key)
{
    if (key.empty())
        return false;
    for (size_t i = 0; i < key.size(); ++i) {
        char c = key[i];
        if (!(('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z') || c == '_' ||
              c == '$' || (i && '0' <= c && c <= '9')))
            return false;
    }
    return true;
}

std::string
AppendKeyToPath(const std::string& path, const std::string& key)
{
    std::string b(path);
    if (IsIdentifier(key)) {
        b += '.';
        b += key;
        return b;
    }
    b += "['";
    for (char c : key) {
        if (c == '\'' || c == '\\')
            b += '\\';
        b += c;
    }
    b += "']";
    return b;
}

std::string
AppendIndexToPath(const std::string& path, size_t index)
{
    return path + '[' + std::to_string(index) + ']';
}

Document::Document(Json&& json, std::string source, bool from_file)
  : root_(std::make_shared<const Json>(std::move(json)), "$")
  , source_(std::move(source))
  , from_file_(from_file)
{
}

Document
Document::loadFromFile(const std::string& path)
{
    std::string text = ReadTextFile(path);
    return Document(ParseText(path, text), path, true);
}

Document
Document::loadFromText(const std::string& text)
{
    return Document(ParseText(kMemorySource, text), kMemorySource, false);
}

} // namespace jdoc
