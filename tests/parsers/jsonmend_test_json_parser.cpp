// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonmend, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "jsonmend/parsers/json.hpp"
#include <atomic>
#include <catch2/catch.hpp>
#include <cmath>
#include <limits>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace jsonmend::parsers;

namespace
{

/// \brief Generate random strings for fuzzing
std::string generateRandomString(std::mt19937 &rng, size_t maxLength = 100)
{
  std::uniform_int_distribution<size_t> lengthDist(0, maxLength);
  std::uniform_int_distribution<int> charDist(32, 126); // Printable ASCII

  size_t length = lengthDist(rng);
  std::string result;
  result.reserve(length);

  for (size_t i = 0; i < length; ++i)
  {
    result.push_back(static_cast<char>(charDist(rng)));
  }
  return result;
}

} // anonymous namespace

TEST_CASE("JSON Parser - Basic Type Construction", "[json][basic]")
{
  SECTION("Null construction")
  {
    Json j;
    REQUIRE(j.isNull());
    REQUIRE(j.type() == JsonType::Null);
    REQUIRE_FALSE(j.isBool());
    REQUIRE_FALSE(j.isNumber());
  }

  SECTION("Integral types collapse to Int")
  {
    REQUIRE(Json(42).isInt());
    REQUIRE(Json(42u).isInt());
    REQUIRE(Json(static_cast<std::int64_t>(-7)).getInt() == -7);
    REQUIRE(Json(static_cast<short>(3)).getInt() == 3);
  }

  SECTION("bool is not an integer")
  {
    Json b(true);
    REQUIRE(b.isBool());
    REQUIRE_FALSE(b.isInt());
  }

  SECTION("Strings")
  {
    REQUIRE(Json("hello").isString());
    REQUIRE(Json(std::string("world")).getString() == "world");
  }

  SECTION("Containers")
  {
    Json arr = Json::array();
    arr.push_back(1);
    arr.push_back("two");
    REQUIRE(arr.isArray());
    REQUIRE(arr.size() == 2);

    Json obj = Json::object();
    obj["a"] = 1;
    REQUIRE(obj.isObject());
    REQUIRE(obj.contains("a"));
    REQUIRE_FALSE(obj.contains("b"));
  }
}

TEST_CASE("JSON Parser - Accessors", "[json][access]")
{
  auto parsed = Json::parseOrThrow(R"({"list": [10, 20], "name": "x", "pi": 3.5})");

  SECTION("Const lookup of missing members yields null")
  {
    const Json &c = parsed;
    REQUIRE(c["missing"].isNull());
    REQUIRE(c["list"][static_cast<std::size_t>(5)].isNull());
  }

  SECTION("at() throws on missing members")
  {
    REQUIRE_THROWS_AS(parsed.at("missing"), std::out_of_range);
    REQUIRE_THROWS_AS(parsed.at("list").at(2), std::out_of_range);
    REQUIRE_THROWS_AS(parsed.at("name").at(0), Json::type_error);
  }

  SECTION("getNumber widens integers")
  {
    REQUIRE(parsed["list"].at(0).getNumber() == Approx(10.0));
    REQUIRE(parsed["pi"].getNumber() == Approx(3.5));
    REQUIRE_THROWS_AS(parsed["name"].getNumber(), Json::type_error);
  }

  SECTION("Comparison with scalars")
  {
    REQUIRE(parsed["name"] == "x");
    REQUIRE(parsed["list"].at(1) == 20);
    REQUIRE(parsed["pi"] == 3.5);
    REQUIRE_FALSE(parsed["pi"] == 3);
  }
}

TEST_CASE("JSON Parser - String Parsing", "[json][parsing]")
{
  SECTION("Valid JSON parsing")
  {
    SECTION("Simple values")
    {
      REQUIRE(Json::parseOrThrow("null").isNull());
      REQUIRE(Json::parseOrThrow("true").getBool() == true);
      REQUIRE(Json::parseOrThrow("false").getBool() == false);
      REQUIRE(Json::parseOrThrow("42").getInt() == 42);
      REQUIRE(Json::parseOrThrow("-123").getInt() == -123);
      REQUIRE(Json::parseOrThrow("3.14159").getDouble() == Approx(3.14159));
      REQUIRE(Json::parseOrThrow("\"hello\"").getString() == "hello");
    }

    SECTION("Nested structures")
    {
      auto nested = Json::parseOrThrow(R"({
        "array": [1, 2, 3],
        "object": {"nested": true},
        "mixed": [{"a": 1}, {"b": 2}]
      })");

      REQUIRE(nested.isObject());
      REQUIRE(nested["array"].size() == 3);
      REQUIRE(nested["object"]["nested"].getBool());
      REQUIRE(nested["mixed"][static_cast<std::size_t>(0)]["a"].getInt() == 1);
    }

    SECTION("Integers beyond int64 become doubles")
    {
      auto big = Json::parseOrThrow("123456789012345678901234567890");
      REQUIRE(big.isDouble());
      REQUIRE(big.getDouble() == Approx(1.2345678901234568e29));
    }

    SECTION("Huge exponents parse as infinity")
    {
      auto inf = Json::parseOrThrow("1e999");
      REQUIRE(inf.isDouble());
      REQUIRE(std::isinf(inf.getDouble()));
    }
  }

  SECTION("Invalid JSON parsing")
  {
    std::vector<std::string> invalidJson = {
      "",                    // Empty
      "{",                   // Incomplete object
      "}",                   // Unexpected closing
      "[1, 2, 3,]",          // Trailing comma
      R"({"key": })",        // Missing value
      R"({key: "value"})",   // Unquoted key
      R"({"key": value})",   // Unquoted value
      R"({'key': 1})",       // Single quotes
      "undefined",           // Invalid literal
      "NaN",                 // Invalid number
      "01",                  // Leading zero
      "1.",                  // Missing fraction digits
      R"("unclosed string)", // Unclosed string
      "[1, 2, 3}",           // Mismatched brackets
      "{} {}",               // Two values
      "\"tab\there\"",       // Raw control character
      "\"bad \\x escape\"",  // Unknown escape
      "\xC2\xA0null"         // Non-ASCII whitespace
    };

    for (const auto &invalid : invalidJson)
    {
      INFO("input: " << invalid);
      auto result = Json::parse(invalid);
      REQUIRE_FALSE(result.ok);
      REQUIRE_FALSE(result.error.message.empty());
      REQUIRE_THROWS_AS(Json::parseOrThrow(invalid), Json::parse_error);
    }
  }

  SECTION("Error location")
  {
    auto result = Json::parse("{\n  \"a\": 1,\n  \"b\" 2\n}");
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.error.where.line == 3);
    REQUIRE(result.error.where.column == 7);
    REQUIRE(result.error.message == "Expected ':'");
  }
}

TEST_CASE("JSON Parser - Unicode escapes", "[json][unicode]")
{
  SECTION("BMP escape")
  {
    REQUIRE(Json::parseOrThrow(R"("caf\u00e9")").getString() == "caf\xC3\xA9");
  }

  SECTION("Surrogate pair")
  {
    REQUIRE(Json::parseOrThrow(R"("\ud83d\ude00")").getString() == "\xF0\x9F\x98\x80");
  }

  SECTION("Lone surrogates become U+FFFD")
  {
    REQUIRE(Json::parseOrThrow(R"("\ud83d!")").getString() == "\xEF\xBF\xBD!");
    REQUIRE(Json::parseOrThrow(R"("\ude00")").getString() == "\xEF\xBF\xBD");
  }

  SECTION("Raw UTF-8 passes through")
  {
    REQUIRE(Json::parseOrThrow("\"\xE4\xB8\x96\"").getString() == "\xE4\xB8\x96");
  }

  SECTION("Malformed UTF-8 in a string is an error")
  {
    for (const char *text : {"\"a\xFF\"", "\"\xC3\"", "\"\xC0\xAF\"", "\"\xED\xA0\x80\"",
                             "{\"k\xE9y\":1}"})
    {
      auto result = Json::parse(text);
      REQUIRE_FALSE(result.ok);
      REQUIRE(result.error.message == "Invalid UTF-8 in string");
      REQUIRE_FALSE(result.error.limitExceeded);
    }
  }

  SECTION("Truncated escape is an error")
  {
    REQUIRE_FALSE(Json::parse(R"("\u12")").ok);
  }
}

TEST_CASE("JSON Parser - Serialization", "[json][serialization]")
{
  SECTION("Basic value serialization")
  {
    REQUIRE(Json().dump() == "null");
    REQUIRE(Json(true).dump() == "true");
    REQUIRE(Json(42).dump() == "42");
    REQUIRE(Json("hello").dump() == "\"hello\"");
  }

  SECTION("Doubles keep a fraction or exponent")
  {
    REQUIRE(Json(1.0).dump() == "1.0");
    REQUIRE(Json(100.0).dump() == "100.0");
    REQUIRE(Json(0.1).dump() == "0.1");
    REQUIRE(Json(-2.5).dump() == "-2.5");
    REQUIRE(Json(1.5e-5).dump() == "0.000015");
    REQUIRE(Json(1e300).dump() == "1e+300");
    REQUIRE(Json(0.30000000000000004).dump() == "0.30000000000000004");
  }

  SECTION("Non-finite doubles cannot be serialized")
  {
    REQUIRE_THROWS_AS(Json(std::numeric_limits<double>::infinity()).dump(), Json::type_error);
    REQUIRE_THROWS_AS(Json(std::nan("")).dump(), Json::type_error);
  }

  SECTION("String escaping")
  {
    REQUIRE(Json("a\"b\\c\n\t").dump() == R"("a\"b\\c\n\t")");
    REQUIRE(Json(std::string("\x01", 1)).dump() == R"("\u0001")");
    REQUIRE(Json("/").dump() == "\"/\"");
  }

  SECTION("Pretty printing with sorted keys")
  {
    auto value = Json::parseOrThrow(R"({"b": [1, {}], "a": {"z": null, "y": []}})");
    SerializeOptions options;
    options.pretty = true;
    options.sortKeys = true;
    REQUIRE(value.serialize(options) == "{\n"
                                        "  \"a\": {\n"
                                        "    \"y\": [],\n"
                                        "    \"z\": null\n"
                                        "  },\n"
                                        "  \"b\": [\n"
                                        "    1,\n"
                                        "    {}\n"
                                        "  ]\n"
                                        "}");
  }

  SECTION("dump() indent argument")
  {
    auto value = Json::parseOrThrow(R"([1])");
    REQUIRE(value.dump() == "[1]");
    REQUIRE(value.dump(4) == "[\n    1\n]");
  }

  SECTION("Round-trip consistency")
  {
    std::vector<std::string> testCases = {R"(null)",
                                          R"(-123.456)",
                                          R"("string with spaces")",
                                          R"([1,2,3])",
                                          R"({"a":1,"b":2})",
                                          R"({"nested":{"array":[1,2,{"deep":true}]}})"};

    for (const auto &testCase : testCases)
    {
      auto parsed = Json::parseOrThrow(testCase);
      auto reparsed = Json::parseOrThrow(parsed.dump());
      REQUIRE(reparsed == parsed);
      REQUIRE(parsed.dump(-1, true) == testCase);
    }
  }
}

TEST_CASE("JSON Parser - Limits", "[json][limits]")
{
  SECTION("Nesting depth")
  {
    ParseLimits limits;
    limits.depthMax = 4;
    REQUIRE(Json::parse("[[[[1]]]]", limits).ok);
    auto result = Json::parse("[[[[[1]]]]]", limits);
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.error.message == "Maximum nesting depth exceeded");
    REQUIRE(result.error.limitExceeded);
  }

  SECTION("Depth counts arrays and objects, not scalars")
  {
    ParseLimits limits;
    limits.depthMax = 2;
    REQUIRE(Json::parse(R"({"a":[1]})", limits).ok);
    REQUIRE(Json::parse("[[]]", limits).ok);
    REQUIRE_FALSE(Json::parse("[[[]]]", limits).ok);
    REQUIRE_FALSE(Json::parse(R"([{"a":{}}])", limits).ok);
    limits.depthMax = 0;
    REQUIRE(Json::parse("7", limits).ok);
    REQUIRE_FALSE(Json::parse("[]", limits).ok);
  }

  SECTION("Syntax errors are not limit failures")
  {
    auto result = Json::parse("[1,");
    REQUIRE_FALSE(result.ok);
    REQUIRE_FALSE(result.error.limitExceeded);
  }

  SECTION("Array and object sizes")
  {
    ParseLimits limits;
    limits.arrayItemsMax = 2;
    limits.membersMax = 1;
    REQUIRE(Json::parse("[1,2]", limits).ok);
    REQUIRE_FALSE(Json::parse("[1,2,3]", limits).ok);
    REQUIRE_FALSE(Json::parse(R"({"a":1,"b":2})", limits).ok);
    REQUIRE(Json::parse("[1,2,3]", limits).error.limitExceeded);
  }
}

TEST_CASE("JSON Parser - Fuzzing Tests", "[json][fuzzing]")
{
  std::mt19937 rng(12345);

  SECTION("Random string fuzzing")
  {
    for (int i = 0; i < 1000; ++i)
    {
      std::string randomStr = generateRandomString(rng);
      auto result = Json::parse(randomStr);
      if (result.ok)
      {
        REQUIRE(Json::parse(result.value.dump()).ok);
      }
    }
  }

  SECTION("Deep nesting is rejected, not overflowed")
  {
    std::string deep = std::string(10000, '[') + std::string(10000, ']');
    REQUIRE_FALSE(Json::parse(deep).ok);
  }
}

TEST_CASE("JSON Parser - Thread Safety", "[json][threading]")
{
  std::vector<std::thread> threads;
  std::atomic<int> successCount{0};

  const std::string validJson = R"({"thread": "test", "number": 42})";

  for (int i = 0; i < 8; ++i)
  {
    threads.emplace_back(
      [&]()
      {
        for (int j = 0; j < 100; ++j)
        {
          auto parsed = Json::parse(validJson);
          if (parsed.ok && parsed.value["thread"] == "test")
          {
            successCount++;
          }
        }
      });
  }

  for (auto &thread : threads)
  {
    thread.join();
  }

  REQUIRE(successCount == 800);
}
