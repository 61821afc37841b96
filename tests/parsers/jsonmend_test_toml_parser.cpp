// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonmend, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "jsonmend/parsers/minimal_toml.hpp"
#include <catch2/catch.hpp>
#include <string>

using namespace jsonmend::parsers;

TEST_CASE("TOML Parser - Values", "[toml][values]")
{
  auto tbl = toml::parse(R"(
# leading comment
title = "jsonmend"   # trailing comment
literal = 'C:\path'
count = 42
negative = -7
grouped = 1_000
ratio = 0.25
exp = 1e3
enabled = true
disabled = false
names = ["a", "b", 'c']
empty = []
)");

  REQUIRE(tbl.at_path("title").as<std::string>().value() == "jsonmend");
  REQUIRE(tbl.at_path("literal").as<std::string>().value() == "C:\\path");
  REQUIRE(tbl.at_path("count").as<int64_t>().value() == 42);
  REQUIRE(tbl.at_path("negative").as<int64_t>().value() == -7);
  REQUIRE(tbl.at_path("grouped").as<int64_t>().value() == 1000);
  REQUIRE(tbl.at_path("ratio").as<double>().value() == Approx(0.25));
  REQUIRE(tbl.at_path("exp").as<double>().value() == Approx(1000.0));
  REQUIRE(tbl.at_path("enabled").as<bool>().value());
  REQUIRE_FALSE(tbl.at_path("disabled").as<bool>().value());

  SECTION("Integers widen to double, nothing else converts")
  {
    REQUIRE(tbl.at_path("count").as<double>().value() == Approx(42.0));
    REQUIRE_FALSE(tbl.at_path("ratio").as<int64_t>().has_value());
    REQUIRE_FALSE(tbl.at_path("title").as<bool>().has_value());
  }

  SECTION("Arrays")
  {
    auto names = tbl.at_path("names");
    REQUIRE(names.is_array());
    REQUIRE(names.as_array()->size() == 3);
    REQUIRE(std::get<std::string>((*names.as_array())[2]) == "c");
    REQUIRE(tbl.at_path("empty").as_array()->empty());
  }

  SECTION("Missing keys yield an empty node")
  {
    REQUIRE_FALSE(tbl.at_path("nope"));
    REQUIRE_FALSE(tbl.at_path("title.deeper"));
  }
}

TEST_CASE("TOML Parser - Tables", "[toml][tables]")
{
  auto tbl = toml::parse(R"(
[jsonmend.log]
level = "debug"

[jsonmend.output]
indent = 4
sortKeys = false

[other]
output.pretty = true
)");

  REQUIRE(tbl.contains("jsonmend"));
  REQUIRE(tbl.at_path("jsonmend").is_table());
  REQUIRE(tbl.at_path("jsonmend.log.level").as<std::string>().value() == "debug");
  REQUIRE(tbl.at_path("jsonmend.output.indent").as<int64_t>().value() == 4);
  REQUIRE_FALSE(tbl.at_path("jsonmend.output.sortKeys").as<bool>().value());
  REQUIRE(tbl.at_path("other.output.pretty").as<bool>().value());
}

TEST_CASE("TOML Parser - Errors", "[toml][errors]")
{
  SECTION("Reports the line number")
  {
    try
    {
      toml::parse("a = 1\nb = 2\nc = ?\n");
      FAIL("expected a parse error");
    }
    catch (const toml::parse_error &e)
    {
      REQUIRE(e.line() == 3);
      REQUIRE(std::string(e.what()).find("line 3") != std::string::npos);
    }
  }

  SECTION("Malformed documents")
  {
    REQUIRE_THROWS_AS(toml::parse("key"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("key = \"unterminated"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("key = [1, 2"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("key = 1 2"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("key = 1\nkey = 2"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("[section"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("n = 12abc"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("a = 1\n[a]\n"), toml::parse_error);
  }

  SECTION("Missing file")
  {
    REQUIRE_THROWS_AS(toml::parse_file("no_such_config.toml"), std::runtime_error);
  }
}
