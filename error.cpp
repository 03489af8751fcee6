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

#include "error.h"

#include <cstring>
#include <sstream>

namespace jdoc {

static std::string
DescribeIoError(const std::string& path, int code)
{
    std::ostringstream oss;
    oss << "cannot read " << path << ": " << strerror(code);
    return oss.str();
}

static std::string
DescribeParseError(const std::string& source,
                   Json::Status status,
                   int line,
                   int column)
{
    std::ostringstream oss;
    oss << source << ':' << line << ':' << column << ": "
        << Json::StatusToString(status);
    return oss.str();
}

Error::Error(const std::string& message) : std::runtime_error(message)
{
}

IoError::IoError(const std::string& path, int code)
  : Error(DescribeIoError(path, code)), path_(path), code_(code)
{
}

ParseError::ParseError(const std::string& source,
                       Json::Status status,
                       size_t offset,
                       int line,
                       int column)
  : Error(DescribeParseError(source, status, line, column))
  , source_(source)
  , status_(status)
  , offset_(offset)
  , line_(line)
  , column_(column)
{
}

ParseError
ParseError::at(const std::string& source,
               const std::string& text,
               Json::Status status,
               size_t offset)
{
    if (offset > text.size())
        offset = text.size();
    int line = 1;
    size_t start = 0;
    for (size_t i = 0; i < offset; ++i) {
        if (text[i] == '\n') {
            ++line;
            start = i + 1;
        }
    }
    return ParseError(
      source, status, offset, line, static_cast<int>(offset - start + 1));
}

NotAnObjectError::NotAnObjectError(const std::string& path, Json::Type actual)
  : Error(path + ": expected object, found " + Json::TypeToString(actual))
  , path_(path)
  , actual_(actual)
{
}

KeyNotFoundError::KeyNotFoundError(const std::string& path,
                                   const std::string& key)
  : Error(path + ": no member named \"" + key + "\""), path_(path), key_(key)
{
}

TypeMismatchError::TypeMismatchError(const std::string& path,
                                     const std::string& key,
                                     const std::string& expected,
                                     const std::string& actual)
  : Error(path + ": expected " + expected + ", found " + actual)
  , path_(path)
  , key_(key)
  , expected_(expected)
  , actual_(actual)
{
}

} // namespace jdoc
