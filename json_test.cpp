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
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

#define ARRAYLEN(A) \
    ((sizeof(A) / sizeof(*(A))) / ((unsigned)!(sizeof(A) % sizeof(*(A)))))

#define STRING(sl) std::string(sl, sizeof(sl) - 1)

using jdoc::Json;

static const char kHuge[] = R"([
    "JSON Test Pattern pass1",
    {"object with 1 member":["array with 1 element"]},
    {},
    [],
    -42,
    true,
    false,
    null,
    {
        "integer": 1234567890,
        "real": -9876.543210,
        "e": 0.123456789e-12,
        "E": 1.234567890E+34,
        "":  23456789012E66,
        "zero": 0,
        "one": 1,
        "space": " ",
        "quote": "\"",
        "backslash": "\\",
        "controls": "\b\f\n\r\t",
        "slash": "/ & \/",
        "alpha": "abcdefghijklmnopqrstuvwyz",
        "ALPHA": "ABCDEFGHIJKLMNOPQRSTUVWYZ",
        "digit": "0123456789",
        "0123456789": "digit",
        "special": "`1~!@#$%^&*()_+-={':[,]}|;.</>?",
        "hex": "\u0123\u4567\u89AB\uCDEF\uabcd\uef4A",
        "true": true,
        "false": false,
        "null": null,
        "array":[  ],
        "object":{  },
        "address": "50 St. James Street",
        "url": "http://www.JSON.org/",
        "comment": "// /* <!-- --",
        "# -- --> */": " ",
        " s p a c e d " :[1,2 , 3

,

4 , 5        ,          6           ,7        ],"compact":[1,2,3,4,5,6,7],
        "jsontext": "{\"object with 1 member\":[\"array with 1 element\"]}",
        "quotes": "&#34; \u0022 %22 0x22 034 &#x22;",
        "\/\\\"\uCAFE\uBABE\uAB98\uFCDE\ubcda\uef4A\b\f\n\r\t`1~!@#$%^&*()_+-=[]{}|;:',./<>?"
: "A key can be any string"
    },
    0.5 ,98.6
,
99.44
,

1066,
1e1,
0.1e1,
1e-1,
1e00,2e+00,2e-00
,"rosebud"])";

#define BENCH(ITERATIONS, WORK_PER_RUN, CODE) \
    do { \
        auto start = std::chrono::high_resolution_clock::now(); \
        for (int __i = 0; __i < ITERATIONS; ++__i) { \
            std::atomic_signal_fence(std::memory_order_acq_rel); \
            CODE; \
        } \
        auto end = std::chrono::high_resolution_clock::now(); \
        auto duration = \
          std::chrono::duration_cast<std::chrono::nanoseconds>(end - start); \
        long long work = (WORK_PER_RUN) * (ITERATIONS); \
        double nanos = (duration.count() + work - 1) / (double)work; \
        printf("%10g ns %2dx %s\n", nanos, (ITERATIONS), #CODE); \
    } while (0)

void
type_test()
{
    if (Json::parse("null").second.getType() != Json::Null)
        exit(1);
    if (Json::parse("true").second.getBool() != true)
        exit(2);
    if (Json::parse("false").second.getBool() != false)
        exit(3);
    if (Json::parse(" 0 ").second.getNumber() != 0)
        exit(4);
    if (Json::parse("\"\"").second.getString() != "")
        exit(5);
    if (!Json::parse("[]").second.getArray().empty())
        exit(6);
    if (!Json::parse("{}").second.getObject().empty())
        exit(7);
    if (std::string(Json::TypeToString(Json::Object)) != "object")
        exit(8);
}

void
number_test()
{
    if (Json::parse("1").second.getNumber() != 1)
        exit(20);
    if (Json::parse("-0.5e2").second.getNumber() != -50)
        exit(21);
    if (Json::parse("1.9").second.getNumber() != 1.9)
        exit(22);
    if (Json::parse("800").second.getNumber() != 800)
        exit(23);
    if (Json::parse("[123.456e-789]").second.getArray()[0].getNumber() != 0)
        exit(24);
    if (!std::isinf(Json::parse("[1.5e+9999]").second.getArray()[0].getNumber()))
        exit(25);
    if (Json::parse("-1.5e+9999").second.getNumber() > 0)
        exit(26);
    if (Json::parse("-123123123123123123123123123123").second.getNumber() !=
        -123123123123123123123123123123.)
        exit(27);
    if (Json::parse("2E-3").second.getNumber() != 2e-3)
        exit(28);
}

void
string_test()
{
    if (Json::parse(R"("\"\\\/\b\f\n\r\t")").second.getString() !=
        "\"\\/\b\f\n\r\t")
        exit(40);
    if (Json::parse(R"("\u0020")").second.getString() != " ")
        exit(41);
    if (Json::parse(R"("\u00e9")").second.getString() != "\xc3\xa9")
        exit(42);
    if (Json::parse("\"\xc3\xa9t\xc3\xa9\"").second.getString() !=
        "\xc3\xa9t\xc3\xa9")
        exit(43);
    if (Json::parse(R"("\ud83d\ude00")").second.getString() !=
        "\xf0\x9f\x98\x80")
        exit(44);
    if (Json::parse("\"\xf0\x9f\x98\x80\"").second.getString() !=
        "\xf0\x9f\x98\x80")
        exit(45);
    if (Json::parse(STRING("\"a\\u0000b\"")).second.getString() !=
        STRING("a\0b"))
        exit(46);
}

// Unpaired UTF-16 surrogates decode to U+FFFD.
void
surrogate_test()
{
    static const struct
    {
        std::string json;
        std::string want;
    } kCases[] = {
        { R"("\uDFAA")", "\xef\xbf\xbd" },
        { R"("\ud800")", "\xef\xbf\xbd" },
        { R"("\ud800abc")", "\xef\xbf\xbd"
                            "abc" },
        { R"("\uDd1e\uD834")", "\xef\xbf\xbd\xef\xbf\xbd" },
        { R"("\uD800\uD800\n")", "\xef\xbf\xbd\xef\xbf\xbd\n" },
    };
    for (size_t i = 0; i < ARRAYLEN(kCases); ++i) {
        std::pair<Json::Status, Json> res = Json::parse(kCases[i].json);
        if (res.first != Json::success)
            exit(60);
        if (res.second.getString() != kCases[i].want) {
            printf("error: %s decoded wrong\n", kCases[i].json.c_str());
            exit(61);
        }
    }
}

void
object_test()
{
    std::pair<Json::Status, Json> res =
      Json::parse(R"({"b": 1, "a": {"c": [true]}, "b": 3})");
    if (res.first != Json::success)
        exit(80);
    const Json& obj = res.second;
    const std::vector<Json::Member>& members = obj.getObject();
    if (members.size() != 3)
        exit(81);
    if (members[0].first != "b" || members[1].first != "a" ||
        members[2].first != "b")
        exit(82);
    const Json* b = obj.find("b");
    if (!b || b->getNumber() != 1)
        exit(83);
    if (obj.find("missing") || obj.contains("c"))
        exit(84);
    const Json* a = obj.find("a");
    if (!a || !a->isObject() || !a->find("c")->getArray()[0].getBool())
        exit(85);
    if (Json(true).find("b"))
        exit(86);

    // lookups survive copies and moves
    Json copy = obj;
    if (copy.find("b")->getNumber() != 1)
        exit(87);
    Json moved = std::move(copy);
    if (!copy.isNull() || moved.find("a") == nullptr)
        exit(88);
}

void
wide_object_test()
{
    std::string s = "{";
    for (int i = 999; i >= 0; --i) {
        if (i != 999)
            s += ',';
        s += "\"k" + std::to_string(i) + "\":" + std::to_string(i);
    }
    s += '}';
    std::pair<Json::Status, Json> res = Json::parse(s);
    if (res.first != Json::success)
        exit(100);
    if (res.second.getObject().front().first != "k999")
        exit(101);
    for (int i = 0; i < 1000; ++i) {
        const Json* v = res.second.find("k" + std::to_string(i));
        if (!v || v->getNumber() != i)
            exit(102);
    }
}

void
depth_test()
{
    const int n = Json::kMaxDepth;
    std::string ok = std::string(n, '[') + std::string(n, ']');
    if (Json::parse(ok).first != Json::success)
        exit(120);
    std::string deep = std::string(n + 1, '[') + std::string(n + 1, ']');
    size_t offset = 0;
    Json out;
    if (Json::parse(deep, out, &offset) != Json::depth_exceeded)
        exit(121);
    if (offset != (size_t)n)
        exit(122);
}

void
offset_test()
{
    Json out(true);
    size_t offset = 0;
    if (Json::parse("[1,\n 2 x]", out, &offset) != Json::missing_comma)
        exit(140);
    if (offset != 7 || !out.isNull())
        exit(141);
    if (Json::parse("[\"abc", out, &offset) != Json::unexpected_end_of_string)
        exit(142);
    if (offset != 1)
        exit(143);
    if (Json::parse("{\"a\":1", out, &offset) != Json::unexpected_eof)
        exit(144);
    if (offset != 6)
        exit(145);
    if (Json::parse("[1] x", out, &offset) != Json::trailing_content)
        exit(146);
    if (offset != 4)
        exit(147);
}

void
getter_test()
{
    Json s("text");
    try {
        s.getNumber();
        exit(160);
    } catch (const std::logic_error&) {
    }
    try {
        Json().getObject();
        exit(161);
    } catch (const std::logic_error&) {
    }
    if (Json(nullptr).getType() != Json::Null)
        exit(162);
    if (Json(static_cast<const char*>(nullptr)).getType() != Json::Null)
        exit(163);
}

void
huge_test()
{
    std::pair<Json::Status, Json> res = Json::parse(kHuge);
    if (res.first != Json::success)
        exit(180);
    const std::vector<Json>& a = res.second.getArray();
    if (a.size() != 20)
        exit(181);
    if (a[0].getString() != "JSON Test Pattern pass1" ||
        a[19].getString() != "rosebud")
        exit(182);
    if (a[4].getNumber() != -42 || !a[7].isNull())
        exit(183);
    const Json& o = a[8];
    if (o.find("integer")->getNumber() != 1234567890)
        exit(184);
    if (o.find("slash")->getString() != "/ & /")
        exit(185);
    if (o.find("controls")->getString() != "\b\f\n\r\t")
        exit(186);
    if (o.find("compact")->getArray().size() != 7)
        exit(187);
    if (o.find(" s p a c e d ")->getArray()[6].getNumber() != 7)
        exit(188);
    if (o.find("")->getNumber() != 23456789012E66)
        exit(189);
}

// https://github.com/nst/JSONTestSuite/
static const struct
{
    Json::Status error;
    std::string json;
} kJsonTestSuite[] = {
    { Json::absent_value, "" },
    { Json::absent_value, " \n\t " },
    { Json::trailing_content, "[] []" },
    { Json::illegal_character, "[nan]" },
    { Json::bad_negative, "[-nan]" },
    { Json::illegal_character, "[+NaN]" },
    { Json::trailing_content,
      "{\"Extra value after close\": true} \"misplaced quoted value\"" },
    { Json::missing_comma, "{\"Illegal expression\": 1 + 2}" },
    { Json::illegal_character, "{\"Illegal invocation\": alert()}" },
    { Json::unexpected_octal, "{\"Numbers cannot have leading zeroes\": 013}" },
    { Json::illegal_character, "{\"Numbers cannot be hex\": 0x14}" },
    { Json::invalid_escape_character, "[\"Illegal backslash escape: \\x15\"]" },
    { Json::illegal_character, "[\\naked]" },
    { Json::invalid_escape_character, "[\"Illegal backslash escape: \\017\"]" },
    { Json::missing_colon, "{\"Missing colon\" null}" },
    { Json::unexpected_colon, "{\"Double colon\":: null}" },
    { Json::unexpected_comma, "{\"Comma instead of colon\", null}" },
    { Json::unexpected_colon, "[\"Colon instead of comma\": false]" },
    { Json::illegal_character, "[\"Bad value\", truth]" },
    { Json::illegal_character, "[\'single quote\']" },
    { Json::non_del_c0_control_code_in_string,
      "[\"\ttab\tcharacter\tin\tstring\t\"]" },
    { Json::invalid_escape_character,
      "[\"tab\\   character\\   in\\  string\\  \"]" },
    { Json::non_del_c0_control_code_in_string, "[\"line\nbreak\"]" },
    { Json::invalid_escape_character, "[\"line\\\nbreak\"]" },
    { Json::bad_exponent, "[0e]" },
    { Json::unexpected_eof, "[\"Unclosed array\"" },
    { Json::bad_exponent, "[0e+]" },
    { Json::bad_exponent, "[0e+-1]" },
    { Json::unexpected_eof, "{\"Comma instead if closing brace\": true," },
    { Json::unexpected_end_of_object, "[\"mismatch\"}" },
    { Json::unexpected_end_of_array, "{\"mismatch\": 1]" },
    { Json::illegal_character, "{unquoted_key: \"keys must be quoted\"}" },
    { Json::unexpected_end_of_array, "[\"extra comma\",]" },
    { Json::unexpected_comma, "[\"double extra comma\",,]" },
    { Json::unexpected_comma, "[   , \"<-- missing value\"]" },
    { Json::trailing_content, "[\"Comma after the close\"]," },
    { Json::trailing_content, "[\"Extra close\"]]" },
    { Json::unexpected_end_of_object, "{\"Extra comma\": true,}" },
    { Json::unexpected_eof, " {\"a\" " },
    { Json::unexpected_eof, " {\"a\": " },
    { Json::unexpected_colon, " {:\"b\" " },
    { Json::missing_colon, " {\"a\" b} " },
    { Json::illegal_character, " {key: 'value'} " },
    { Json::missing_comma, " {\"a\":\"a\" 123} " },
    { Json::object_key_must_be_string, " {[: \"x\"} " },
    { Json::object_key_must_be_string, " {1:1} " },
    { Json::object_missing_value, "{\"a\":}" },
    { Json::illegal_character, " [.123] " },
    { Json::bad_negative, " [-.123] " },
    { Json::bad_negative, " [-foo] " },
    { Json::bad_negative, " [-Infinity] " },
    { Json::illegal_character, " [Infinity] " },
    { Json::illegal_character, " [NaN] " },
    { Json::illegal_character, " [+1] " },
    { Json::illegal_character, " [1.2a-3] " },
    { Json::illegal_character, " [-1x] " },
    { Json::illegal_character, " [0x42] " },
    { Json::illegal_character, " [1e0e] " },
    { Json::illegal_character, " [0.1.2] " },
    { Json::bad_double, " [1.] " },
    { Json::bad_double, " [2.e3] " },
    { Json::bad_double, " [-2.] " },
    { Json::bad_double, " [9.e+] " },
    { Json::bad_exponent, " [1eE2] " },
    { Json::bad_exponent, " [1.0e-] " },
    { Json::bad_exponent, " [0E+] " },
    { Json::unexpected_octal, " [012] " },
    { Json::unexpected_octal, " [-012] " },
    { Json::unexpected_octal, " [-01] " },
    { Json::missing_comma, " [1 000.0] " },
    { Json::bad_negative, " [- 1] " },
    { Json::bad_negative, " [-] " },
    { Json::bad_negative, " [--2.] " },
    { Json::illegal_character, " [tru] " },
    { Json::illegal_character, " [nul] " },
    { Json::illegal_character, " [fals] " },
    { Json::unexpected_eof, " [{} " },
    { Json::unexpected_eof, "\n[1,\n1\n,1  " },
    { Json::unexpected_eof, " [1, " },
    { Json::unexpected_eof, " [\"\" " },
    { Json::illegal_character, " [* " },
    { Json::unexpected_colon, " [1:2] " },
    { Json::unexpected_colon, " [\"\": 1] " },
    { Json::unexpected_comma, " {\"x\", null} " },
    { Json::unexpected_colon, " {\"x\"::\"b\"} " },
    { Json::unexpected_comma, " [1,,] " },
    { Json::unexpected_end_of_array, " [1,] " },
    { Json::unexpected_comma, " [1,,2] " },
    { Json::unexpected_comma, " [,1] " },
    { Json::missing_comma, " [ 3[ 4]] " },
    { Json::missing_comma, " [1 true] " },
    { Json::missing_comma, " [\"a\" \"b\"] " },
    { Json::trailing_content, "\n[\"x\"]]" },
    { Json::illegal_character, STRING("\x00") },
    { Json::illegal_character, " \x5b\xff\x5d " },
    { Json::illegal_character, " \xef\xbb\xbf{} " },
    { Json::illegal_character, STRING(" [\x00\"\x00\xe9\x00\"\x00]\x00 ") },
    { Json::unexpected_end_of_string, "[\"abc" },
    { Json::unexpected_end_of_string, "[\"abc\\" },
    { Json::invalid_unicode_escape, "[\"\\u12\"]" },
    { Json::invalid_unicode_escape, "[\"\\uZZZZ\"]" },
    { Json::non_del_c0_control_code_in_string,
      " \x5b\x22\x0b\x61\x22\x5c\x66\x5d " },
    { Json::malformed_utf8, " [\"\xe0\xff\"] " },
    { Json::malformed_utf8, " [\"\xe9\"] " },
    { Json::malformed_utf8, " [\"\xc3" },
    { Json::illegal_utf8_character, " [\"\xfc\x80\x80\x80\x80\x80\"] " },
    { Json::illegal_utf8_character, " [\"\xfc\x83\xbf\xbf\xbf\xbf\"] " },
    { Json::illegal_utf8_character, " [\"\xff\"] " },
    { Json::illegal_utf8_character, " {\"\xb9\":\"0\",} " },
    { Json::overlong_ascii, " [\"\xc0\xaf\"] " },
    { Json::overlong_utf8_0x7ff, " [\"\xe0\x80\xaf\"] " },
    { Json::overlong_utf8_0xffff, " [\"\xf0\x80\x80\xaf\"] " },
    { Json::utf16_surrogate_in_utf8, " [\"\xed\xa0\x80\"] " },
    { Json::utf8_exceeds_utf16_range, " [\"\xf4\xbf\xbf\xbf\"] " },
    { Json::c1_control_code_in_string, " [\"\x81\"] " },
    { Json::success, kHuge },
    { Json::success, "[\"\xef\xbc\x91\"]" },
    { Json::success, " [\"\xf4\x8f\xbf\xbf\"] " },
    { Json::success, "[1e1, 0.1e1, 1e-1, 1e00, 2e+00, 2e-00, -0, 0.0]" },
    { Json::success,
      R"([[[[[[[[[[[[[[[[[[["Not too deep"]]]]]]]]]]]]]]]]]]])" },
    { Json::success, R"({
    "JSON Test Pattern pass3": {
        "The outermost value": "must be an object or array.",
        "In this test": "It is an object."
    }
}
)" },
};

void
json_test_suite()
{
    for (size_t i = 0; i < ARRAYLEN(kJsonTestSuite); ++i) {
        std::pair<Json::Status, Json> res = Json::parse(kJsonTestSuite[i].json);
        if (res.first != kJsonTestSuite[i].error) {
            printf(
              "error: Json::parse returned Json::%s but wanted Json::%s: %s\n",
              Json::StatusToString(res.first),
              Json::StatusToString(kJsonTestSuite[i].error),
              kJsonTestSuite[i].json.c_str());
            exit(12);
        }
    }
}

void
afl_regression()
{
    Json::parse("[{\"\":1,3:14,]\n");
    Json::parse("[\n"
                "\n"
                "3E14,\n"
                "{\"!\":4,733:4,[\n"
                "\n"
                "3EL%,3E14,\n"
                "{][1][1,,]");
    Json::parse("[\n"
                "null,\n"
                "1,\n"
                "3.14,\n"
                "{\"a\": \"b\",\n"
                "3:14,ull}\n"
                "]");
    Json::parse("[\n"
                "\n"
                "3E14,\n"
                "{\"a!!:!!!!!!!!!!!!!!!\":4, \n"
                "\n"
                "3E1:4, \n"
                "\n"
                "3E1,,\n"
                ",,\n"
                "3[\n"
                "\n"
                "]");
}

int
main()
{
    type_test();
    number_test();
    string_test();
    surrogate_test();
    object_test();
    wide_object_test();
    depth_test();
    offset_test();
    getter_test();
    huge_test();
    afl_regression();
    json_test_suite();

    BENCH(2000, 1, type_test());
    BENCH(2000, 1, object_test());
    BENCH(2000, 1, huge_test());
    BENCH(200, 1, json_test_suite());
}
