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
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace jdoc {

class JsonParser;

// Immutable JSON value.
//
// Values are built by Json::parse() and never change afterwards, so a
// tree may be read from any number of threads at once. Object members
// keep document order; lookups go through a key index built when the
// object is parsed, and the first of several duplicate keys wins.
class Json
{
  public:
    enum Type
    {
        Null,
        Bool,
        Number,
        String,
        Array,
        Object,
    };

    enum Status
    {
        success,
        absent_value,
        bad_double,
        bad_negative,
        bad_exponent,
        missing_comma,
        missing_colon,
        malformed_utf8,
        depth_exceeded,
        unexpected_eof,
        overlong_ascii,
        unexpected_comma,
        unexpected_colon,
        unexpected_octal,
        trailing_content,
        illegal_character,
        overlong_utf8_0x7ff,
        overlong_utf8_0xffff,
        object_missing_value,
        illegal_utf8_character,
        invalid_unicode_escape,
        utf16_surrogate_in_utf8,
        unexpected_end_of_array,
        invalid_escape_character,
        utf8_exceeds_utf16_range,
        unexpected_end_of_string,
        unexpected_end_of_object,
        object_key_must_be_string,
        c1_control_code_in_string,
        non_del_c0_control_code_in_string,
    };

    typedef std::pair<std::string, Json> Member;

    // Maximum number of nested arrays and objects.
    static constexpr int kMaxDepth = 128;

    Json() : type_(Null)
    {
    }

    Json(std::nullptr_t) : type_(Null)
    {
    }

    Json(bool value) : type_(Bool), bool_value(value)
    {
    }

    Json(int value) : type_(Number), number_value(value)
    {
    }

    Json(double value) : type_(Number), number_value(value)
    {
    }

    Json(const char* value);
    Json(const std::string& value);
    Json(std::string&& value);

    ~Json();

    Json(const Json&);
    Json(Json&&) noexcept;
    Json& operator=(const Json&);
    Json& operator=(Json&&) noexcept;

    Type getType() const
    {
        return type_;
    }

    bool isNull() const
    {
        return type_ == Null;
    }

    bool isBool() const
    {
        return type_ == Bool;
    }

    bool isNumber() const
    {
        return type_ == Number;
    }

    bool isString() const
    {
        return type_ == String;
    }

    bool isArray() const
    {
        return type_ == Array;
    }

    bool isObject() const
    {
        return type_ == Object;
    }

    bool getBool() const;
    double getNumber() const;
    const std::string& getString() const;
    const std::vector<Json>& getArray() const;

    // Object members in document order, duplicates included.
    const std::vector<Member>& getObject() const;

    // Returns the first member named `key`, or nullptr when this is
    // not an object or has no such member.
    const Json* find(const std::string& key) const;

    bool contains(const std::string& key) const
    {
        return find(key) != nullptr;
    }

    static std::pair<Status, Json> parse(const std::string& text);

    // Parses `text` into `out`. On failure `*out_offset` receives the
    // byte offset of the offending input and `out` is left null.
    static Status parse(const std::string& text,
                        Json& out,
                        size_t* out_offset);

    static const char* StatusToString(Status);
    static const char* TypeToString(Type);

  private:
    friend class JsonParser;

    struct ObjectValue
    {
        std::vector<Member> members;
        std::vector<size_t> index; // member positions sorted by key
    };

    Type type_;
    union
    {
        bool bool_value;
        double number_value;
        std::string string_value;
        std::vector<Json> array_value;
        ObjectValue object_value;
    };

    void clear();
    void setArray();
    void setObject();
    void indexObject();
};

} // namespace jdoc
