// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonmend, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

// Typical breakage seen in language model output, end to end through load().

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using jsonmend::recovery::CollectingSink;
using jsonmend::recovery::DiagnosticKind;
using jsonmend::test::compact;

namespace
{
std::string mend(const std::string &text) { return compact(jsonmend::load(text)); }
} // namespace

TEST_CASE("Scenarios - Truncated output", "[scenario][truncated]")
{
  SECTION("Missing closing brackets")
  {
    REQUIRE(mend(R"({"name": "John Doe", "age": 30, "courses": ["Math", "Science")") ==
            R"({"age":30,"courses":["Math","Science"],"name":"John Doe"})");
  }

  SECTION("Unclosed object as a value")
  {
    REQUIRE(mend(R"({"data": {"key1": "value1", "key2": {"nested_key": "nested_value")") ==
            R"({"data":{"key1":"value1","key2":{"nested_key":"nested_value"}}})");
  }

  SECTION("Deep nesting with unquoted keys")
  {
    REQUIRE(mend(R"({"id": 1, "user": {name: "Alice", details: { "email": "alice@example.com", affiliations: ["Org1", "Org2)") ==
            R"({"id":1,"user":{"details":{"affiliations":["Org1","Org2"],"email":"alice@example.com"},"name":"Alice"}})");
  }

  SECTION("Truncated stream of objects")
  {
    auto value = jsonmend::load(
      R"({"event": "start", "id": 1}{"event": "update", "id": 1, "payload": {"status": "in_progress")");
    REQUIRE(value.isArray());
    REQUIRE(value.size() == 2);
    REQUIRE(compact(value.at(0)) == R"({"event":"start","id":1})");
    REQUIRE(compact(value.at(1)) ==
            R"({"event":"update","id":1,"payload":{"status":"in_progress"}})");
  }
}

TEST_CASE("Scenarios - Loose syntax", "[scenario][syntax]")
{
  SECTION("Unquoted keys")
  {
    auto value = jsonmend::load("{name: \"Alice\", age: 30, active: true}");
    REQUIRE(value.contains("name"));
    REQUIRE(value.contains("age"));
    REQUIRE(value.contains("active"));
    REQUIRE(compact(value) == R"({"active":true,"age":30,"name":"Alice"})");
  }

  SECTION("Unquoted array items")
  {
    REQUIRE(mend(R"(["string1", item2, 3, "item4)") == R"(["string1","item2",3,"item4"])");
  }

  SECTION("Escaped quotes and an unterminated string")
  {
    REQUIRE(
      mend(R"({"quote": "He said, \"This is a test.", "message": "Here's another quote: 'Hello World')") ==
      R"({"message":"Here's another quote: 'Hello World'","quote":"He said, \"This is a test."})");
  }

  SECTION("No colons or commas at all")
  {
    // Without ':' the whole remainder reads as one key
    REQUIRE(mend(R"({user "John" age 30 city "New York" valid true)") ==
            R"({"user \"John\" age 30 city \"New York\" valid true":null})");
  }

  SECTION("Empty key and a missing value")
  {
    CollectingSink sink;
    jsonmend::RepairOptions options;
    options.sink = &sink;
    auto value = jsonmend::load(
      R"({"": "empty key", "key_with_missing_value":, "another_key": "value"})", options);
    REQUIRE(compact(value) == R"({"":"value","key_with_missing_value":"another_key"})");

    auto all = sink.diagnostics();
    REQUIRE(all.size() == 4);
    REQUIRE(all[0].kind == DiagnosticKind::GarbageSkipped);
    REQUIRE(all[0].detail == ", ");
    REQUIRE(all[1].kind == DiagnosticKind::MissingComma);
    REQUIRE(all[2].kind == DiagnosticKind::UnquotedString);
    REQUIRE(all[3].kind == DiagnosticKind::DuplicateKey);
  }
}

TEST_CASE("Scenarios - Surrounding prose", "[scenario][prose]")
{
  SECTION("Leading explanation")
  {
    REQUIRE(mend(R"(Here is the JSON: {"result": "success", "code": 200)") ==
            R"({"code":200,"result":"success"})");
  }

  SECTION("Leading explanation with truncated nested output")
  {
    REQUIRE(
      mend(R"(Here is the JSON: {"reasoning": "The user wants a summary.", "result": {"summary": "This is a summary text...)") ==
      R"({"reasoning":"The user wants a summary.","result":{"summary":"This is a summary text..."}})");
  }

  SECTION("Markdown fence")
  {
    REQUIRE(mend("```json\n{\"a\": [1, 2]}\n```") == R"({"a":[1,2]})");
  }

  SECTION("Trailing remark")
  {
    REQUIRE(mend(R"({"ok": true} Let me know if you need anything else!)") ==
            R"({"ok":true})");
  }
}
