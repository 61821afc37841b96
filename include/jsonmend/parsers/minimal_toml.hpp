// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file minimal_toml.hpp
/// \brief The TOML subset used by jsonmend configuration files.
///
/// Supported: [section] and [dotted.section] headers, bare and dotted keys,
/// basic ("...") and literal ('...') strings, integers, floats, booleans,
/// single-line arrays, and # comments. Errors carry the 1-based line number.

#include <cctype>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace jsonmend
{
namespace parsers
{
namespace toml
{

class table;
class array;

using value_type = std::variant<std::monostate, int64_t, double, bool, std::string,
                                std::shared_ptr<table>, std::shared_ptr<array>>;

/// \brief Syntax error in a TOML document.
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string &message, std::size_t line)
      : std::runtime_error("TOML parse error at line " + std::to_string(line) + ": " + message),
        _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

class array
{
public:
  using container_type = std::vector<value_type>;
  using const_iterator = container_type::const_iterator;

  void push_back(value_type &&val) { _values.push_back(std::move(val)); }

  size_t size() const { return _values.size(); }
  bool empty() const { return _values.empty(); }

  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

  const value_type &operator[](size_t idx) const { return _values[idx]; }

private:
  container_type _values;
};

/// \brief A value slot; empty when a lookup found nothing.
class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  bool is_value() const
  {
    return !std::holds_alternative<std::monostate>(_value) && !is_table() && !is_array();
  }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<int64_t>(_value); }
  bool is_floating_point() const { return std::holds_alternative<double>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_array() const { return std::holds_alternative<std::shared_ptr<array>>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  /// \brief Typed read; integers widen to double, nothing else converts.
  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, double>)
    {
      if (auto *i = std::get_if<int64_t>(&_value))
        return static_cast<double>(*i);
    }
    if (auto *val = std::get_if<T>(&_value))
      return *val;
    return std::nullopt;
  }

  const array *as_array() const
  {
    auto *val = std::get_if<std::shared_ptr<array>>(&_value);
    return val ? val->get() : nullptr;
  }

  table *as_table()
  {
    auto *val = std::get_if<std::shared_ptr<table>>(&_value);
    return val ? val->get() : nullptr;
  }

  const table *as_table() const
  {
    auto *val = std::get_if<std::shared_ptr<table>>(&_value);
    return val ? val->get() : nullptr;
  }

  explicit operator bool() const { return !std::holds_alternative<std::monostate>(_value); }

private:
  value_type _value;
};

class table
{
public:
  using container_type = std::unordered_map<std::string, node>;
  using const_iterator = container_type::const_iterator;

  bool contains(const std::string &key) const { return _values.find(key) != _values.end(); }
  bool empty() const { return _values.empty(); }
  size_t size() const { return _values.size(); }

  node &operator[](const std::string &key) { return _values[key]; }

  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

  /// \brief Look up "a.b.c" through nested tables; empty node if absent.
  node at_path(const std::string &dottedPath) const
  {
    const table *current = this;
    std::size_t start = 0;
    while (current)
    {
      std::size_t dot = dottedPath.find('.', start);
      std::string part = dottedPath.substr(start, dot == std::string::npos ? dot : dot - start);
      auto it = current->_values.find(part);
      if (it == current->_values.end())
        return node();
      if (dot == std::string::npos)
        return it->second;
      current = it->second.as_table();
      start = dot + 1;
    }
    return node();
  }

  /// \brief Descend through (and create) the tables named by \p path.
  /// \return nullptr when a path component names a non-table value
  table *ensure_path(const std::vector<std::string> &path)
  {
    table *current = this;
    for (const auto &part : path)
    {
      auto &slot = current->_values[part];
      if (!slot)
      {
        slot = node(std::make_shared<table>());
      }
      current = slot.as_table();
      if (!current)
        return nullptr;
    }
    return current;
  }

private:
  container_type _values;
};

class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)) {}

  table parse()
  {
    table root;
    table *current = &root;

    while (true)
    {
      skipBlankLines();
      if (isEnd())
        break;

      if (peek() == '[')
      {
        advance();
        auto path = parseKeyPath(']');
        expect(']');
        current = root.ensure_path(path);
        if (!current)
          throw parse_error("section redefines a value", _line);
      }
      else
      {
        auto path = parseKeyPath('=');
        expect('=');
        skipInlineSpace();
        value_type value = parseValue();

        std::string leaf = path.back();
        path.pop_back();
        table *target = current->ensure_path(path);
        if (!target)
          throw parse_error("key redefines a value", _line);
        if (target->contains(leaf))
          throw parse_error("duplicate key '" + leaf + "'", _line);
        (*target)[leaf] = node(std::move(value));
      }
      endOfLine();
    }
    return root;
  }

private:
  std::string _input;
  std::size_t _pos{0};
  std::size_t _line{1};

  bool isEnd() const { return _pos >= _input.size(); }
  char peek() const { return isEnd() ? '\0' : _input[_pos]; }

  char advance()
  {
    if (isEnd())
      return '\0';
    char c = _input[_pos++];
    if (c == '\n')
      ++_line;
    return c;
  }

  void expect(char c)
  {
    skipInlineSpace();
    if (peek() != c)
      throw parse_error(std::string("expected '") + c + "'", _line);
    advance();
  }

  void skipInlineSpace()
  {
    while (peek() == ' ' || peek() == '\t')
      advance();
  }

  void skipComment()
  {
    if (peek() == '#')
    {
      while (!isEnd() && peek() != '\n')
        advance();
    }
  }

  void skipBlankLines()
  {
    while (!isEnd())
    {
      skipInlineSpace();
      skipComment();
      if (peek() == '\n' || peek() == '\r')
        advance();
      else
        break;
    }
  }

  void endOfLine()
  {
    skipInlineSpace();
    skipComment();
    if (peek() == '\r')
      advance();
    if (!isEnd() && peek() != '\n')
      throw parse_error("unexpected trailing characters", _line);
  }

  std::vector<std::string> parseKeyPath(char terminator)
  {
    std::vector<std::string> parts;
    while (true)
    {
      skipInlineSpace();
      std::string part;
      if (peek() == '"' || peek() == '\'')
      {
        part = parseString();
      }
      else
      {
        while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' ||
               peek() == '-')
          part += advance();
        if (part.empty())
          throw parse_error("expected a key", _line);
      }
      parts.push_back(std::move(part));

      skipInlineSpace();
      if (peek() == '.')
      {
        advance();
        continue;
      }
      if (peek() != terminator)
        throw parse_error(std::string("expected '") + terminator + "' after key", _line);
      return parts;
    }
  }

  value_type parseValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
      return parseString();
    if (c == '[')
      return parseArray();
    if (c == 't' || c == 'f')
      return parseBool();
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return parseNumber();
    throw parse_error("invalid value", _line);
  }

  std::string parseString()
  {
    char quote = advance();
    std::string str;
    while (!isEnd() && peek() != quote && peek() != '\n')
    {
      char c = advance();
      if (c != '\\' || quote == '\'')
      {
        str += c;
        continue;
      }
      switch (char esc = advance())
      {
      case 'n':
        str += '\n';
        break;
      case 't':
        str += '\t';
        break;
      case 'r':
        str += '\r';
        break;
      case '\\':
      case '"':
        str += esc;
        break;
      default:
        throw parse_error(std::string("invalid escape '\\") + esc + "'", _line);
      }
    }
    if (peek() != quote)
      throw parse_error("unterminated string", _line);
    advance();
    return str;
  }

  value_type parseArray()
  {
    advance(); // '['
    auto arr = std::make_shared<array>();
    while (true)
    {
      skipInlineSpace();
      if (peek() == ']')
        break;
      arr->push_back(parseValue());
      skipInlineSpace();
      if (peek() != ',')
        break;
      advance();
    }
    if (peek() != ']')
      throw parse_error("unterminated array", _line);
    advance();
    return arr;
  }

  bool parseBool()
  {
    if (_input.compare(_pos, 4, "true") == 0)
    {
      _pos += 4;
      return true;
    }
    if (_input.compare(_pos, 5, "false") == 0)
    {
      _pos += 5;
      return false;
    }
    throw parse_error("invalid boolean", _line);
  }

  value_type parseNumber()
  {
    std::string num;
    bool isFloat = false;
    while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '.' || peek() == '+' ||
           peek() == '-' || peek() == '_')
    {
      char c = advance();
      if (c == '_')
        continue;
      if (c == '.' || c == 'e' || c == 'E')
        isFloat = true;
      num += c;
    }

    std::size_t used = 0;
    try
    {
      if (isFloat)
      {
        double d = std::stod(num, &used);
        if (used == num.size())
          return d;
      }
      else
      {
        long long i = std::stoll(num, &used);
        if (used == num.size())
          return static_cast<int64_t>(i);
      }
    }
    catch (const std::logic_error &)
    {
      // std::invalid_argument / std::out_of_range, reported below
    }
    throw parse_error("invalid number '" + num + "'", _line);
  }
};

inline table parse(const std::string &text)
{
  parser p(text);
  return p.parse();
}

inline table parse_file(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
    throw std::runtime_error("Cannot open file: " + filename);

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace jsonmend
