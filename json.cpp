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

#include "json.h"

#include <algorithm>
#include <cstring>
#include <new>
#include <stdexcept>

#include "double-conversion/string-to-double.h"

#define ASCII 0
#define C0 1
#define DQUOTE 2
#define BACKSLASH 3
#define UTF8_2 4
#define UTF8_3 5
#define UTF8_4 6
#define C1 7
#define UTF8_3_E0 8
#define UTF8_3_ED 9
#define UTF8_4_F0 10
#define BADUTF8 11
#define EVILUTF8 12

#define UTF16_MASK 0xfc00
#define UTF16_MOAR 0xd800 // 0xD800..0xDBFF
#define UTF16_CONT 0xdc00 // 0xDC00..0xDFFF

#define IsSurrogate(wc) ((0xf800 & (wc)) == 0xd800)
#define IsHighSurrogate(wc) (((wc) & UTF16_MASK) == UTF16_MOAR)
#define IsLowSurrogate(wc) (((wc) & UTF16_MASK) == UTF16_CONT)
#define MergeUtf16(hi, lo) ((((hi) - 0xD800) << 10) + ((lo) - 0xDC00) + 0x10000)
#define IsUtf8Cont(x) (0200 == (0300 & (x)))

#define ON_LOGIC_ERROR(s) throw std::logic_error(s)

namespace jdoc {

static const char kJsonStr[256] = {
    1,  1,  1,  1,  1,  1,  1,  1, // 0000 ascii (0)
    1,  1,  1,  1,  1,  1,  1,  1, // 0010
    1,  1,  1,  1,  1,  1,  1,  1, // 0020 c0 (1)
    1,  1,  1,  1,  1,  1,  1,  1, // 0030
    0,  0,  2,  0,  0,  0,  0,  0, // 0040 dquote (2)
    0,  0,  0,  0,  0,  0,  0,  0, // 0050
    0,  0,  0,  0,  0,  0,  0,  0, // 0060
    0,  0,  0,  0,  0,  0,  0,  0, // 0070
    0,  0,  0,  0,  0,  0,  0,  0, // 0100
    0,  0,  0,  0,  0,  0,  0,  0, // 0110
    0,  0,  0,  0,  0,  0,  0,  0, // 0120
    0,  0,  0,  0,  3,  0,  0,  0, // 0130 backslash (3)
    0,  0,  0,  0,  0,  0,  0,  0, // 0140
    0,  0,  0,  0,  0,  0,  0,  0, // 0150
    0,  0,  0,  0,  0,  0,  0,  0, // 0160
    0,  0,  0,  0,  0,  0,  0,  0, // 0170
    7,  7,  7,  7,  7,  7,  7,  7, // 0200 c1 (7)
    7,  7,  7,  7,  7,  7,  7,  7, // 0210
    7,  7,  7,  7,  7,  7,  7,  7, // 0220
    7,  7,  7,  7,  7,  7,  7,  7, // 0230
    11, 11, 11, 11, 11, 11, 11, 11, // 0240 latin1 (11)
    11, 11, 11, 11, 11, 11, 11, 11, // 0250
    11, 11, 11, 11, 11, 11, 11, 11, // 0260
    11, 11, 11, 11, 11, 11, 11, 11, // 0270
    12, 12, 4,  4,  4,  4,  4,  4, // 0300 utf8-2 (4)
    4,  4,  4,  4,  4,  4,  4,  4, // 0310
    4,  4,  4,  4,  4,  4,  4,  4, // 0320 utf8-2
    4,  4,  4,  4,  4,  4,  4,  4, // 0330
    8,  5,  5,  5,  5,  5,  5,  5, // 0340 utf8-3 (5)
    5,  5,  5,  5,  5,  9,  5,  5, // 0350
    10, 6,  6,  6,  6,  11, 11, 11, // 0360 utf8-4 (6)
    11, 11, 11, 11, 11, 11, 11, 11, // 0370
};

alignas(signed char) static const signed char kHexToInt[256] = {
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x00
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x10
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x20
    0,  1,  2,  3,  4,  5,  6,  7,  8,  9,  -1, -1, -1, -1, -1, -1, // 0x30
    -1, 10, 11, 12, 13, 14, 15, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x40
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x50
    -1, 10, 11, 12, 13, 14, 15, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x60
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x70
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x80
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x90
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xa0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xb0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xc0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xd0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xe0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xf0
};

// The parser validates the number grammar itself, so the converter
// only ever sees a complete, well-formed JSON number.
static const double_conversion::StringToDoubleConverter kJsonToDouble(
  double_conversion::StringToDoubleConverter::NO_FLAGS,
  0.0,
  0.0,
  nullptr,
  nullptr);

static inline bool
IsDigit(int c)
{
    return '0' <= c && c <= '9';
}

static inline bool
IsWordChar(int c)
{
    return IsDigit(c) || ('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z') ||
           c == '_' || c == '.';
}

static void
AppendUtf8(std::string& b, unsigned c)
{
    char w[4];
    int i;
    if (c <= 0x7f) {
        w[0] = c;
        i = 1;
    } else if (c <= 0x7ff) {
        w[0] = 0300 | (c >> 6);
        w[1] = 0200 | (c & 077);
        i = 2;
    } else if (c <= 0xffff) {
        if (IsSurrogate(c))
            c = 0xfffd;
        w[0] = 0340 | (c >> 12);
        w[1] = 0200 | ((c >> 6) & 077);
        w[2] = 0200 | (c & 077);
        i = 3;
    } else {
        w[0] = 0360 | (c >> 18);
        w[1] = 0200 | ((c >> 12) & 077);
        w[2] = 0200 | ((c >> 6) & 077);
        w[3] = 0200 | (c & 077);
        i = 4;
    }
    b.append(w, i);
}

Json::Json(const char* value)
{
    if (value) {
        type_ = String;
        new (&string_value) std::string(value);
    } else {
        type_ = Null;
    }
}

Json::Json(const std::string& value) : type_(String), string_value(value)
{
}

Json::Json(std::string&& value) : type_(String), string_value(std::move(value))
{
}

Json::~Json()
{
    if (type_ >= String)
        clear();
}

void
Json::clear()
{
    switch (type_) {
        case String:
            string_value.~basic_string();
            break;
        case Array:
            array_value.~vector();
            break;
        case Object:
            object_value.~ObjectValue();
            break;
        default:
            break;
    }
    type_ = Null;
}

Json::Json(const Json& other) : type_(other.type_)
{
    switch (type_) {
        case Null:
            break;
        case Bool:
            bool_value = other.bool_value;
            break;
        case Number:
            number_value = other.number_value;
            break;
        case String:
            new (&string_value) std::string(other.string_value);
            break;
        case Array:
            new (&array_value) std::vector<Json>(other.array_value);
            break;
        case Object:
            new (&object_value) ObjectValue(other.object_value);
            break;
        default:
            ON_LOGIC_ERROR("Unhandled JSON type.");
    }
}

Json::Json(Json&& other) noexcept : type_(other.type_)
{
    switch (type_) {
        case Bool:
            bool_value = other.bool_value;
            break;
        case Number:
            number_value = other.number_value;
            break;
        case String:
            new (&string_value) std::string(std::move(other.string_value));
            other.clear();
            break;
        case Array:
            new (&array_value) std::vector<Json>(std::move(other.array_value));
            other.clear();
            break;
        case Object:
            new (&object_value) ObjectValue(std::move(other.object_value));
            other.clear();
            break;
        default:
            break;
    }
    other.type_ = Null;
}

Json&
Json::operator=(const Json& other)
{
    if (this != &other) {
        Json tmp(other);
        *this = std::move(tmp);
    }
    return *this;
}

Json&
Json::operator=(Json&& other) noexcept
{
    if (this != &other) {
        Json tmp(std::move(other)); // other may live inside *this
        if (type_ >= String)
            clear();
        new (this) Json(std::move(tmp));
    }
    return *this;
}

bool
Json::getBool() const
{
    if (type_ != Bool)
        ON_LOGIC_ERROR("JSON value is not a bool.");
    return bool_value;
}

double
Json::getNumber() const
{
    if (type_ != Number)
        ON_LOGIC_ERROR("JSON value is not a number.");
    return number_value;
}

const std::string&
Json::getString() const
{
    if (type_ != String)
        ON_LOGIC_ERROR("JSON value is not a string.");
    return string_value;
}

const std::vector<Json>&
Json::getArray() const
{
    if (type_ != Array)
        ON_LOGIC_ERROR("JSON value is not an array.");
    return array_value;
}

const std::vector<Json::Member>&
Json::getObject() const
{
    if (type_ != Object)
        ON_LOGIC_ERROR("JSON value is not an object.");
    return object_value.members;
}

const Json*
Json::find(const std::string& key) const
{
    if (type_ != Object)
        return nullptr;
    const std::vector<Member>& members = object_value.members;
    auto it = std::lower_bound(
      object_value.index.begin(),
      object_value.index.end(),
      key,
      [&members](size_t i, const std::string& k) {
          return members[i].first < k;
      });
    if (it == object_value.index.end() || members[*it].first != key)
        return nullptr;
    return &members[*it].second;
}

void
Json::setArray()
{
    if (type_ >= String)
        clear();
    type_ = Array;
    new (&array_value) std::vector<Json>();
}

void
Json::setObject()
{
    if (type_ >= String)
        clear();
    type_ = Object;
    new (&object_value) ObjectValue();
}

// Sorts member positions by key. The sort is stable, so among equal
// keys the earliest member comes first and wins lookups.
void
Json::indexObject()
{
    const std::vector<Member>& members = object_value.members;
    std::vector<size_t>& index = object_value.index;
    index.resize(members.size());
    for (size_t i = 0; i < index.size(); ++i)
        index[i] = i;
    std::stable_sort(
      index.begin(), index.end(), [&members](size_t a, size_t b) {
          return members[a].first < members[b].first;
      });
}

// Strict RFC 8259 recursive descent parser.
//
// Each parse method leaves p_ just past what it consumed. Failures go
// through fail(), which records where the bad input starts.
class JsonParser
{
  public:
    JsonParser(const char* p, const char* e) : begin_(p), p_(p), e_(e), at_(p)
    {
    }

    Json::Status parse(Json& json);

    size_t offset() const
    {
        return at_ - begin_;
    }

  private:
    const char* const begin_;
    const char* p_;
    const char* const e_;
    const char* at_;

    Json::Status fail(Json::Status status, const char* at)
    {
        at_ = at;
        return status;
    }

    void skipSpace()
    {
        while (p_ < e_ &&
               (*p_ == ' ' || *p_ == '\n' || *p_ == '\r' || *p_ == '\t'))
            ++p_;
    }

    Json::Status parseValue(Json& json, int depth);
    Json::Status parseLiteral(const char* word, size_t n);
    Json::Status parseNumber(Json& json);
    Json::Status parseString(std::string& b);
    Json::Status parseEscape(std::string& b);
    Json::Status parseUtf8(std::string& b, int c, int kind);
    Json::Status parseArray(Json& json, int depth);
    Json::Status parseObject(Json& json, int depth);
};

Json::Status
JsonParser::parse(Json& json)
{
    skipSpace();
    if (p_ == e_)
        return fail(Json::absent_value, p_);
    Json::Status status = parseValue(json, Json::kMaxDepth);
    if (status != Json::success)
        return status;
    skipSpace();
    if (p_ != e_)
        return fail(Json::trailing_content, p_);
    return Json::success;
}

Json::Status
JsonParser::parseValue(Json& json, int depth)
{
    skipSpace();
    if (p_ == e_)
        return fail(Json::unexpected_eof, p_);
    Json::Status status;
    switch (*p_ & 255) {
        case '{':
            if (!depth)
                return fail(Json::depth_exceeded, p_);
            return parseObject(json, depth - 1);
        case '[':
            if (!depth)
                return fail(Json::depth_exceeded, p_);
            return parseArray(json, depth - 1);
        case '"': {
            std::string b;
            if ((status = parseString(b)) != Json::success)
                return status;
            json = Json(std::move(b));
            return Json::success;
        }
        case 't':
            if ((status = parseLiteral("true", 4)) == Json::success)
                json = Json(true);
            return status;
        case 'f':
            if ((status = parseLiteral("false", 5)) == Json::success)
                json = Json(false);
            return status;
        case 'n':
            if ((status = parseLiteral("null", 4)) == Json::success)
                json = Json();
            return status;
        case '-':
        case '0':
        case '1':
        case '2':
        case '3':
        case '4':
        case '5':
        case '6':
        case '7':
        case '8':
        case '9':
            return parseNumber(json);
        case ',':
            return fail(Json::unexpected_comma, p_);
        case ':':
            return fail(Json::unexpected_colon, p_);
        case ']':
            return fail(Json::unexpected_end_of_array, p_);
        case '}':
            return fail(Json::unexpected_end_of_object, p_);
        default:
            return fail(Json::illegal_character, p_);
    }
}

Json::Status
JsonParser::parseLiteral(const char* word, size_t n)
{
    if ((size_t)(e_ - p_) < n || memcmp(p_, word, n) ||
        (p_ + n < e_ && IsWordChar(p_[n] & 255)))
        return fail(Json::illegal_character, p_);
    p_ += n;
    return Json::success;
}

Json::Status
JsonParser::parseNumber(Json& json)
{
    const char* a = p_;
    if (*p_ == '-') {
        ++p_;
        if (p_ == e_ || !IsDigit(*p_ & 255))
            return fail(Json::bad_negative, a);
    }
    if (*p_ == '0') {
        ++p_;
        if (p_ < e_ && IsDigit(*p_ & 255))
            return fail(Json::unexpected_octal, a);
    } else {
        while (p_ < e_ && IsDigit(*p_ & 255))
            ++p_;
    }
    if (p_ < e_ && *p_ == '.') {
        ++p_;
        if (p_ == e_ || !IsDigit(*p_ & 255))
            return fail(Json::bad_double, a);
        while (p_ < e_ && IsDigit(*p_ & 255))
            ++p_;
    }
    if (p_ < e_ && (*p_ == 'e' || *p_ == 'E')) {
        ++p_;
        if (p_ < e_ && (*p_ == '+' || *p_ == '-'))
            ++p_;
        if (p_ == e_ || !IsDigit(*p_ & 255))
            return fail(Json::bad_exponent, a);
        while (p_ < e_ && IsDigit(*p_ & 255))
            ++p_;
    }
    if (p_ < e_ && IsWordChar(*p_ & 255))
        return fail(Json::illegal_character, p_);
    int processed;
    double value = kJsonToDouble.StringToDouble(a, p_ - a, &processed);
    if (processed != p_ - a)
        return fail(Json::bad_double, a);
    json = Json(value);
    return Json::success;
}

Json::Status
JsonParser::parseString(std::string& b)
{
    const char* q = p_++;
    for (;;) {
        if (p_ == e_)
            return fail(Json::unexpected_end_of_string, q);
        int c = *p_++ & 255;
        int kind = kJsonStr[c];
        switch (kind) {
            case ASCII:
                b += c;
                break;
            case DQUOTE:
                return Json::success;
            case BACKSLASH: {
                Json::Status status = parseEscape(b);
                if (status != Json::success)
                    return status;
                break;
            }
            case C0:
                return fail(Json::non_del_c0_control_code_in_string, p_ - 1);
            case C1:
                return fail(Json::c1_control_code_in_string, p_ - 1);
            case EVILUTF8:
                if (p_ < e_ && IsUtf8Cont(*p_ & 255))
                    return fail(Json::overlong_ascii, p_ - 1);
                return fail(Json::illegal_utf8_character, p_ - 1);
            case BADUTF8:
                return fail(Json::illegal_utf8_character, p_ - 1);
            default: {
                Json::Status status = parseUtf8(b, c, kind);
                if (status != Json::success)
                    return status;
                break;
            }
        }
    }
}

// Validates one multibyte sequence whose lead byte `c` was just read
// and copies it through unchanged.
Json::Status
JsonParser::parseUtf8(std::string& b, int c, int kind)
{
    const char* lead = p_ - 1;
    int n;
    switch (kind) {
        case UTF8_2:
            n = 1;
            break;
        case UTF8_3:
        case UTF8_3_E0:
        case UTF8_3_ED:
            n = 2;
            break;
        case UTF8_4:
        case UTF8_4_F0:
            n = 3;
            break;
        default:
            ON_LOGIC_ERROR("Unhandled character category during string parsing.");
    }
    if (e_ - p_ < n)
        return fail(Json::malformed_utf8, lead);
    for (int i = 0; i < n; ++i)
        if (!IsUtf8Cont(p_[i] & 255))
            return fail(Json::malformed_utf8, lead);
    int c1 = p_[0] & 255;
    if (kind == UTF8_3_E0 && c1 < 0240)
        return fail(Json::overlong_utf8_0x7ff, lead);
    if (kind == UTF8_3_ED && c1 >= 0240)
        return fail(Json::utf16_surrogate_in_utf8, lead);
    if (kind == UTF8_4_F0 && c1 < 0220)
        return fail(Json::overlong_utf8_0xffff, lead);
    if (c == 0364 && c1 >= 0220)
        return fail(Json::utf8_exceeds_utf16_range, lead);
    b.append(lead, n + 1);
    p_ += n;
    return Json::success;
}

Json::Status
JsonParser::parseEscape(std::string& b)
{
    const char* esc = p_ - 1;
    if (p_ == e_)
        return fail(Json::unexpected_end_of_string, esc);
    int A, B, C, D;
    unsigned c, u;
    switch (*p_++ & 255) {
        case '"':
            b += '"';
            return Json::success;
        case '/':
            b += '/';
            return Json::success;
        case '\\':
            b += '\\';
            return Json::success;
        case 'b':
            b += '\b';
            return Json::success;
        case 'f':
            b += '\f';
            return Json::success;
        case 'n':
            b += '\n';
            return Json::success;
        case 'r':
            b += '\r';
            return Json::success;
        case 't':
            b += '\t';
            return Json::success;
        case 'u':
            break;
        default:
            return fail(Json::invalid_escape_character, esc);
    }
    if (e_ - p_ < 4 || //
        (A = kHexToInt[p_[0] & 255]) == -1 || //
        (B = kHexToInt[p_[1] & 255]) == -1 || //
        (C = kHexToInt[p_[2] & 255]) == -1 || //
        (D = kHexToInt[p_[3] & 255]) == -1)
        return fail(Json::invalid_unicode_escape, esc);
    c = A << 12 | B << 8 | C << 4 | D;
    p_ += 4;
    if (IsHighSurrogate(c) && e_ - p_ >= 6 && //
        p_[0] == '\\' && p_[1] == 'u' && //
        (A = kHexToInt[p_[2] & 255]) != -1 && //
        (B = kHexToInt[p_[3] & 255]) != -1 && //
        (C = kHexToInt[p_[4] & 255]) != -1 && //
        (D = kHexToInt[p_[5] & 255]) != -1) {
        u = A << 12 | B << 8 | C << 4 | D;
        if (IsLowSurrogate(u)) {
            c = MergeUtf16(c, u);
            p_ += 6;
        }
    }
    // unpaired surrogates become U+FFFD
    AppendUtf8(b, c);
    return Json::success;
}

Json::Status
JsonParser::parseArray(Json& json, int depth)
{
    ++p_;
    json.setArray();
    skipSpace();
    if (p_ < e_ && *p_ == ']') {
        ++p_;
        return Json::success;
    }
    for (;;) {
        Json value;
        Json::Status status = parseValue(value, depth);
        if (status != Json::success)
            return status;
        json.array_value.emplace_back(std::move(value));
        skipSpace();
        if (p_ == e_)
            return fail(Json::unexpected_eof, p_);
        switch (*p_) {
            case ',':
                ++p_;
                skipSpace();
                if (p_ < e_ && *p_ == ']')
                    return fail(Json::unexpected_end_of_array, p_);
                break;
            case ']':
                ++p_;
                return Json::success;
            case '}':
                return fail(Json::unexpected_end_of_object, p_);
            case ':':
                return fail(Json::unexpected_colon, p_);
            default:
                return fail(Json::missing_comma, p_);
        }
    }
}

Json::Status
JsonParser::parseObject(Json& json, int depth)
{
    ++p_;
    json.setObject();
    skipSpace();
    if (p_ < e_ && *p_ == '}') {
        ++p_;
        return Json::success;
    }
    for (;;) {
        skipSpace();
        if (p_ == e_)
            return fail(Json::unexpected_eof, p_);
        switch (*p_ & 255) {
            case '"':
                break;
            case '}':
                return fail(Json::unexpected_end_of_object, p_);
            case ',':
                return fail(Json::unexpected_comma, p_);
            case ':':
                return fail(Json::unexpected_colon, p_);
            case '{':
            case '[':
            case '-':
            case '0':
            case '1':
            case '2':
            case '3':
            case '4':
            case '5':
            case '6':
            case '7':
            case '8':
            case '9':
            case 't':
            case 'f':
            case 'n':
                return fail(Json::object_key_must_be_string, p_);
            default:
                return fail(Json::illegal_character, p_);
        }
        std::string key;
        Json::Status status = parseString(key);
        if (status != Json::success)
            return status;
        skipSpace();
        if (p_ == e_)
            return fail(Json::unexpected_eof, p_);
        if (*p_ != ':') {
            if (*p_ == ',')
                return fail(Json::unexpected_comma, p_);
            return fail(Json::missing_colon, p_);
        }
        ++p_;
        skipSpace();
        if (p_ < e_ && *p_ == '}')
            return fail(Json::object_missing_value, p_);
        Json value;
        if ((status = parseValue(value, depth)) != Json::success)
            return status;
        json.object_value.members.emplace_back(std::move(key),
                                               std::move(value));
        skipSpace();
        if (p_ == e_)
            return fail(Json::unexpected_eof, p_);
        switch (*p_) {
            case ',':
                ++p_;
                skipSpace();
                if (p_ < e_ && *p_ == '}')
                    return fail(Json::unexpected_end_of_object, p_);
                break;
            case '}':
                ++p_;
                json.indexObject();
                return Json::success;
            case ']':
                return fail(Json::unexpected_end_of_array, p_);
            case ':':
                return fail(Json::unexpected_colon, p_);
            default:
                return fail(Json::missing_comma, p_);
        }
    }
}

Json::Status
Json::parse(const std::string& text, Json& out, size_t* out_offset)
{
    JsonParser parser(text.data(), text.data() + text.size());
    Json json;
    Status status = parser.parse(json);
    if (status == success) {
        out = std::move(json);
    } else {
        out = Json();
        if (out_offset)
            *out_offset = parser.offset();
    }
    return status;
}

std::pair<Json::Status, Json>
Json::parse(const std::string& text)
{
    std::pair<Json::Status, Json> res;
    res.first = parse(text, res.second, nullptr);
    return res;
}

const char*
Json::StatusToString(Json::Status status)
{
    switch (status) {
        case success:
            return "success";
        case absent_value:
            return "absent_value";
        case bad_double:
            return "bad_double";
        case bad_negative:
            return "bad_negative";
        case bad_exponent:
            return "bad_exponent";
        case missing_comma:
            return "missing_comma";
        case missing_colon:
            return "missing_colon";
        case malformed_utf8:
            return "malformed_utf8";
        case depth_exceeded:
            return "depth_exceeded";
        case unexpected_eof:
            return "unexpected_eof";
        case overlong_ascii:
            return "overlong_ascii";
        case unexpected_comma:
            return "unexpected_comma";
        case unexpected_colon:
            return "unexpected_colon";
        case unexpected_octal:
            return "unexpected_octal";
        case trailing_content:
            return "trailing_content";
        case illegal_character:
            return "illegal_character";
        case overlong_utf8_0x7ff:
            return "overlong_utf8_0x7ff";
        case overlong_utf8_0xffff:
            return "overlong_utf8_0xffff";
        case object_missing_value:
            return "object_missing_value";
        case illegal_utf8_character:
            return "illegal_utf8_character";
        case invalid_unicode_escape:
            return "invalid_unicode_escape";
        case utf16_surrogate_in_utf8:
            return "utf16_surrogate_in_utf8";
        case unexpected_end_of_array:
            return "unexpected_end_of_array";
        case invalid_escape_character:
            return "invalid_escape_character";
        case utf8_exceeds_utf16_range:
            return "utf8_exceeds_utf16_range";
        case unexpected_end_of_string:
            return "unexpected_end_of_string";
        case unexpected_end_of_object:
            return "unexpected_end_of_object";
        case object_key_must_be_string:
            return "object_key_must_be_string";
        case c1_control_code_in_string:
            return "c1_control_code_in_string";
        case non_del_c0_control_code_in_string:
            return "non_del_c0_control_code_in_string";
        default:
            ON_LOGIC_ERROR("Unhandled Json status value.");
    }
}

const char*
Json::TypeToString(Json::Type type)
{
    switch (type) {
        case Null:
            return "null";
        case Bool:
            return "boolean";
        case Number:
            return "number";
        case String:
            return "string";
        case Array:
            return "array";
        case Object:
            return "object";
        default:
            ON_LOGIC_ERROR("Unhandled JSON type.");
    }
}

} // namespace jdoc
