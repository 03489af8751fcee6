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
#include <cstddef>
#include <stdexcept>
#include <string>

namespace jdoc {

// Base of every error raised while loading or reading a document.
class Error : public std::runtime_error
{
  public:
    explicit Error(const std::string& message);
};

// The source file could not be opened or read.
class IoError : public Error
{
  public:
    IoError(const std::string& path, int code);

    const std::string& path() const
    {
        return path_;
    }

    // errno value reported by the C library.
    int code() const
    {
        return code_;
    }

  private:
    std::string path_;
    int code_;
};

// The text is not well-formed JSON. Lines and columns count from one;
// columns count bytes.
class ParseError : public Error
{
  public:
    ParseError(const std::string& source,
               Json::Status status,
               size_t offset,
               int line,
               int column);

    // Builds the error for a failure at byte `offset` of `text`.
    static ParseError at(const std::string& source,
                         const std::string& text,
                         Json::Status status,
                         size_t offset);

    const std::string& source() const
    {
        return source_;
    }

    Json::Status status() const
    {
        return status_;
    }

    size_t offset() const
    {
        return offset_;
    }

    int line() const
    {
        return line_;
    }

    int column() const
    {
        return column_;
    }

  private:
    std::string source_;
    Json::Status status_;
    size_t offset_;
    int line_;
    int column_;
};

class NotAnObjectError : public Error
{
  public:
    NotAnObjectError(const std::string& path, Json::Type actual);

    const std::string& path() const
    {
        return path_;
    }

    Json::Type actual() const
    {
        return actual_;
    }

  private:
    std::string path_;
    Json::Type actual_;
};

class KeyNotFoundError : public Error
{
  public:
    KeyNotFoundError(const std::string& path, const std::string& key);

    // Path of the object that lacks the key.
    const std::string& path() const
    {
        return path_;
    }

    const std::string& key() const
    {
        return key_;
    }

  private:
    std::string path_;
    std::string key_;
};

// A value exists but cannot be read as the requested kind. `path`
// names the offending value itself, which for array reads is the bad
// element.
class TypeMismatchError : public Error
{
  public:
    TypeMismatchError(const std::string& path,
                      const std::string& key,
                      const std::string& expected,
                      const std::string& actual);

    const std::string& path() const
    {
        return path_;
    }

    const std::string& key() const
    {
        return key_;
    }

    const std::string& expected() const
    {
        return expected_;
    }

    const std::string& actual() const
    {
        return actual_;
    }

  private:
    std::string path_;
    std::string key_;
    std::string expected_;
    std::string actual_;
};

} // namespace jdoc
