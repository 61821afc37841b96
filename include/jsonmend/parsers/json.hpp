// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file json.hpp
/// \brief JSON value, strict parser, and serializer for jsonmend.
///
/// Features
/// --------
/// - Header-only, C++17, no third-party deps
/// - DOM-like \c Json value: null, bool, int64, double, string, array, object
/// - Strict RFC 8259 parser with error reporting (line/column), no
///   exceptions by default; used as the fast path in front of the repair
///   engine
/// - Optional throwing parse (parseOrThrow)
/// - Serializer with pretty-printing and key sorting
///
/// Notes
/// -----
/// - Numbers are parsed as either 64-bit signed integers or double-precision
///   floats. Integers outside the 64-bit range are parsed as double.
/// - \\uXXXX escapes are decoded to UTF-8; surrogate pairs are combined and
///   lone surrogates become U+FFFD.
/// - Doubles are serialized in the shortest form that reads back to the same
///   value and always carry a fraction or exponent, so a float stays a float
///   across a serialize/parse cycle. Non-finite doubles cannot be serialized.
/// - Object key order is not preserved (\c std::unordered_map). Use
///   SerializeOptions::sortKeys for stable output order.
///

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "jsonmend/util/utf8.hpp"

namespace jsonmend
{
namespace parsers
{
/// \brief JSON type tags, in variant index order.
enum class JsonType
{
  Null,
  Boolean,
  Int,
  Double,
  String,
  Array,
  Object
};

/// \brief Location of a parse error in the source text.
struct JsonLocation
{
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};
};

/// \brief Error information produced by the parser.
struct JsonError
{
  std::string message;
  JsonLocation where;
  bool limitExceeded{false}; ///< A ParseLimits bound stopped the parse, not a syntax error
};

/// \brief Parse limits to prevent resource exhaustion.
struct ParseLimits
{
  std::size_t arrayItemsMax{100000};     ///< Maximum array elements
  std::size_t membersMax{100000};        ///< Maximum object members
  std::size_t depthMax{128};             ///< Maximum nesting of arrays and objects
  std::size_t stringLengthMax{16777216}; ///< Maximum string length in bytes
};

/// \brief Serialization options.
struct SerializeOptions
{
  bool pretty{false};       ///< Pretty-print with indentation
  bool sortKeys{false};     ///< Sort object keys alphabetically
  std::string indent{"  "}; ///< Indentation string for pretty printing
};

struct ParseResult;

// =============================================================
// Json class - main JSON value representation
// =============================================================
class Json
{
public:
  using Array = std::vector<Json>;
  using Object = std::unordered_map<std::string, Json>;

  class parse_error : public std::runtime_error
  {
  public:
    explicit parse_error(const std::string &msg) : std::runtime_error(msg) {}
  };

  class type_error : public std::runtime_error
  {
  public:
    explicit type_error(const std::string &msg) : std::runtime_error(msg) {}
  };

private:
#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmaybe-uninitialized"
#endif
  using Value =
    std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array, Object>;
  Value _value;
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif

public:
  Json() : _value(nullptr) {}
  Json(std::nullptr_t) : _value(nullptr) {}
  Json(bool b) : _value(b) {}
  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
  Json(T i) : _value(static_cast<std::int64_t>(i))
  {
  }
  Json(double d) : _value(d) {}
  Json(const char *s) : _value(std::string(s)) {}
  Json(const std::string &s) : _value(s) {}
  Json(std::string &&s) : _value(std::move(s)) {}
  Json(const Array &a) : _value(a) {}
  Json(Array &&a) : _value(std::move(a)) {}
  Json(const Object &o) : _value(o) {}
  Json(Object &&o) : _value(std::move(o)) {}

  static Json object() { return Json(Object{}); }
  static Json array() { return Json(Array{}); }

  // Type queries
  JsonType type() const { return static_cast<JsonType>(_value.index()); }

  bool isNull() const { return std::holds_alternative<std::nullptr_t>(_value); }
  bool isBool() const { return std::holds_alternative<bool>(_value); }
  bool isInt() const { return std::holds_alternative<std::int64_t>(_value); }
  bool isDouble() const { return std::holds_alternative<double>(_value); }
  bool isNumber() const { return isInt() || isDouble(); }
  bool isString() const { return std::holds_alternative<std::string>(_value); }
  bool isArray() const { return std::holds_alternative<Array>(_value); }
  bool isObject() const { return std::holds_alternative<Object>(_value); }

  // Value accessors; throw std::bad_variant_access on a type mismatch
  bool getBool() const { return std::get<bool>(_value); }
  std::int64_t getInt() const { return std::get<std::int64_t>(_value); }
  double getDouble() const { return std::get<double>(_value); }
  const std::string &getString() const { return std::get<std::string>(_value); }
  const Array &getArray() const { return std::get<Array>(_value); }
  const Object &getObject() const { return std::get<Object>(_value); }

  std::string &getString() { return std::get<std::string>(_value); }
  Array &getArray() { return std::get<Array>(_value); }
  Object &getObject() { return std::get<Object>(_value); }

  /// \brief Numeric value of an Int or Double.
  double getNumber() const
  {
    if (isDouble())
      return getDouble();
    if (isInt())
      return static_cast<double>(getInt());
    throw type_error("value is not a number");
  }

  // Array operations
  Json &operator[](std::size_t index)
  {
    if (!isArray())
    {
      _value = Array{};
    }
    auto &arr = getArray();
    if (arr.size() <= index)
    {
      arr.resize(index + 1);
    }
    return arr[index];
  }

  const Json &operator[](std::size_t index) const
  {
    static const Json nullJson;
    if (!isArray() || index >= getArray().size())
    {
      return nullJson;
    }
    return getArray()[index];
  }

  // Object operations
  Json &operator[](const std::string &key)
  {
    if (!isObject())
    {
      _value = Object{};
    }
    return getObject()[key];
  }

  Json &operator[](const char *key) { return operator[](std::string(key)); }

  const Json &operator[](const std::string &key) const
  {
    static const Json nullJson;
    if (!isObject())
    {
      return nullJson;
    }
    auto it = getObject().find(key);
    return (it != getObject().end()) ? it->second : nullJson;
  }

  const Json &operator[](const char *key) const { return operator[](std::string(key)); }

  bool contains(const std::string &key) const
  {
    if (!isObject())
      return false;
    const auto &obj = getObject();
    return obj.find(key) != obj.end();
  }

  const Json &at(const std::string &key) const
  {
    if (!isObject())
      throw type_error("cannot use at() with non-object");
    const auto &obj = getObject();
    auto it = obj.find(key);
    if (it == obj.end())
      throw std::out_of_range("key '" + key + "' not found");
    return it->second;
  }

  const Json &at(std::size_t index) const
  {
    if (!isArray())
      throw type_error("cannot use at() with non-array");
    const auto &arr = getArray();
    if (index >= arr.size())
      throw std::out_of_range("array index " + std::to_string(index) + " out of range");
    return arr[index];
  }

  std::size_t size() const
  {
    if (isArray())
      return getArray().size();
    if (isObject())
      return getObject().size();
    if (isString())
      return getString().size();
    if (isNull())
      return 0;
    throw type_error("cannot get size of a scalar");
  }

  bool empty() const
  {
    if (isArray())
      return getArray().empty();
    if (isObject())
      return getObject().empty();
    if (isString())
      return getString().empty();
    return isNull();
  }

  void push_back(Json &&val)
  {
    if (!isArray())
    {
      _value = Array{};
    }
    getArray().push_back(std::move(val));
  }

  void push_back(const Json &val)
  {
    if (!isArray())
    {
      _value = Array{};
    }
    getArray().push_back(val);
  }

  // Serialization
  std::string serialize(const SerializeOptions &options = {}) const
  {
    std::string out;
    _serialize(out, options, 0);
    return out;
  }

  std::string dump(int indent = -1, bool sortKeys = false) const
  {
    SerializeOptions opts;
    if (indent >= 0)
    {
      opts.pretty = true;
      opts.indent = std::string(static_cast<std::size_t>(indent), ' ');
    }
    opts.sortKeys = sortKeys;
    return serialize(opts);
  }

  // Strict parsing (defined after ParseResult)
  static ParseResult parse(std::string_view text, const ParseLimits &limits = ParseLimits{});
  static Json parseOrThrow(std::string_view text, const ParseLimits &limits = ParseLimits{});

  // Comparison operators
  bool operator==(const Json &other) const { return _value == other._value; }
  bool operator!=(const Json &other) const { return !(*this == other); }
  bool operator==(const std::string &str) const { return isString() && getString() == str; }
  bool operator==(const char *str) const { return isString() && getString() == str; }
  bool operator==(bool val) const { return isBool() && getBool() == val; }
  bool operator==(double val) const { return isDouble() && getDouble() == val; }
  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
  bool operator==(T val) const
  {
    return isInt() && getInt() == static_cast<std::int64_t>(val);
  }

  friend std::ostream &operator<<(std::ostream &os, const Json &j)
  {
    os << j.dump();
    return os;
  }

private:
  void _serialize(std::string &out, const SerializeOptions &options, int depth) const
  {
    switch (type())
    {
    case JsonType::Null:
      out += "null";
      break;
    case JsonType::Boolean:
      out += getBool() ? "true" : "false";
      break;
    case JsonType::Int:
      out += std::to_string(getInt());
      break;
    case JsonType::Double:
      out += _formatDouble(getDouble());
      break;
    case JsonType::String:
      _escapeString(out, getString());
      break;
    case JsonType::Array:
      _serializeArray(out, options, depth);
      break;
    case JsonType::Object:
      _serializeObject(out, options, depth);
      break;
    }
  }

  static void _newline(std::string &out, const SerializeOptions &options, int depth)
  {
    if (!options.pretty)
      return;
    out += '\n';
    for (int j = 0; j < depth; ++j)
    {
      out += options.indent;
    }
  }

  void _serializeArray(std::string &out, const SerializeOptions &options, int depth) const
  {
    const auto &arr = getArray();
    if (arr.empty())
    {
      out += "[]";
      return;
    }

    out += '[';
    for (std::size_t i = 0; i < arr.size(); ++i)
    {
      if (i > 0)
        out += ',';
      _newline(out, options, depth + 1);
      arr[i]._serialize(out, options, depth + 1);
    }
    _newline(out, options, depth);
    out += ']';
  }

  void _serializeObject(std::string &out, const SerializeOptions &options, int depth) const
  {
    const auto &obj = getObject();
    if (obj.empty())
    {
      out += "{}";
      return;
    }

    std::vector<const Object::value_type *> members;
    members.reserve(obj.size());
    for (const auto &member : obj)
    {
      members.push_back(&member);
    }
    if (options.sortKeys)
    {
      std::sort(members.begin(), members.end(),
                [](const auto *a, const auto *b) { return a->first < b->first; });
    }

    out += '{';
    for (std::size_t i = 0; i < members.size(); ++i)
    {
      if (i > 0)
        out += ',';
      _newline(out, options, depth + 1);
      _escapeString(out, members[i]->first);
      out += options.pretty ? ": " : ":";
      members[i]->second._serialize(out, options, depth + 1);
    }
    _newline(out, options, depth);
    out += '}';
  }

  static std::string _formatDouble(double d)
  {
    if (!std::isfinite(d))
    {
      throw type_error("cannot serialize non-finite number");
    }

    char buf[64];
    int precision = 1;
    for (; precision <= 17; ++precision)
    {
      std::snprintf(buf, sizeof(buf), "%.*g", precision, d);
      if (std::strtod(buf, nullptr) == d)
        break;
    }
    precision = std::min(precision, 17);

    // %g switches to exponent form early (100.0 -> "1e+02"); keep plain
    // notation for moderate magnitudes
    if (const char *e = std::strchr(buf, 'e'))
    {
      int exponent = std::atoi(e + 1);
      if (exponent >= -5 && exponent < 17)
      {
        std::snprintf(buf, sizeof(buf), "%.*f", std::max(0, precision - 1 - exponent), d);
      }
    }

    std::string text(buf);
    if (text.find_first_of(".e") == std::string::npos)
    {
      text += ".0";
    }
    return text;
  }

  static void _escapeString(std::string &out, const std::string &str)
  {
    out += '"';
    for (char c : str)
    {
      switch (c)
      {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20)
        {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
          out += buf;
        }
        else
        {
          out += c;
        }
      }
    }
    out += '"';
  }
};

/// \brief Result of a non-throwing parse operation.
struct ParseResult
{
  Json value;      ///< Parsed JSON value (null if ok == false)
  bool ok{false};  ///< True if parsing succeeded
  JsonError error; ///< Error info when ok == false
};

// =============================================================
// Strict JSON parser
// =============================================================
class JsonParser
{
public:
  explicit JsonParser(std::string_view text, const ParseLimits &limits)
      : _text(text), _pos(0), _limits(limits)
  {
  }

  ParseResult parse()
  {
    ParseResult result;
    _skipWhitespace();

    if (_pos >= _text.size())
    {
      result.error.message = "Unexpected end of input";
      result.error.where = _getLocation();
      return result;
    }

    if (_parseValue(result.value, 0U))
    {
      _skipWhitespace();
      if (_pos < _text.size())
      {
        result.value = Json();
        result.error.message = "Extra characters after JSON value";
        result.error.where = _getLocation();
        return result;
      }
      result.ok = true;
    }
    else
    {
      result.value = Json();
      result.error.message = _error.empty() ? "Parse error" : _error;
      result.error.where = _getLocation();
      result.error.limitExceeded = _limitExceeded;
    }

    return result;
  }

private:
  std::string_view _text;
  std::size_t _pos;
  ParseLimits _limits;
  std::string _error;
  bool _limitExceeded{false};

  JsonLocation _getLocation() const
  {
    JsonLocation loc;
    loc.offset = _pos;
    for (std::size_t i = 0; i < _pos && i < _text.size(); ++i)
    {
      if (_text[i] == '\n')
      {
        ++loc.line;
        loc.column = 1;
      }
      else
      {
        ++loc.column;
      }
    }
    return loc;
  }

  bool _fail(const char *message)
  {
    _error = message;
    return false;
  }

  bool _failLimit(const char *message)
  {
    _limitExceeded = true;
    return _fail(message);
  }

  bool _isDigit(std::size_t pos) const
  {
    return pos < _text.size() && _text[pos] >= '0' && _text[pos] <= '9';
  }

  // RFC 8259 insignificant whitespace only
  void _skipWhitespace()
  {
    while (_pos < _text.size() &&
           (_text[_pos] == ' ' || _text[_pos] == '\t' || _text[_pos] == '\n' || _text[_pos] == '\r'))
    {
      ++_pos;
    }
  }

  // depth counts the arrays and objects enclosing the value
  bool _parseValue(Json &out, std::size_t depth)
  {
    _skipWhitespace();
    if (_pos >= _text.size())
    {
      return _fail("Unexpected end of input");
    }

    switch (_text[_pos])
    {
    case 'n':
      return _parseLiteral(out, "null", Json());
    case 't':
      return _parseLiteral(out, "true", Json(true));
    case 'f':
      return _parseLiteral(out, "false", Json(false));
    case '"':
    {
      std::string str;
      if (!_parseString(str))
        return false;
      out = Json(std::move(str));
      return true;
    }
    case '[':
    case '{':
      if (depth >= _limits.depthMax)
        return _failLimit("Maximum nesting depth exceeded");
      return _text[_pos] == '[' ? _parseArray(out, depth) : _parseObject(out, depth);
    default:
      if (_text[_pos] == '-' || _isDigit(_pos))
        return _parseNumber(out);
      return _fail("Unexpected character");
    }
  }

  bool _parseLiteral(Json &out, std::string_view literal, Json value)
  {
    if (_text.substr(_pos, literal.size()) != literal)
    {
      return _fail("Invalid literal");
    }
    _pos += literal.size();
    out = std::move(value);
    return true;
  }

  bool _parseNumber(Json &out)
  {
    std::size_t start = _pos;
    if (_text[_pos] == '-')
      ++_pos;

    if (!_isDigit(_pos))
      return _fail("Invalid number format");

    // No leading zeros
    if (_text[_pos] == '0')
    {
      ++_pos;
    }
    else
    {
      while (_isDigit(_pos))
        ++_pos;
    }

    bool isFloat = false;
    if (_pos < _text.size() && _text[_pos] == '.')
    {
      isFloat = true;
      ++_pos;
      if (!_isDigit(_pos))
        return _fail("Invalid number format");
      while (_isDigit(_pos))
        ++_pos;
    }

    if (_pos < _text.size() && (_text[_pos] == 'e' || _text[_pos] == 'E'))
    {
      isFloat = true;
      ++_pos;
      if (_pos < _text.size() && (_text[_pos] == '+' || _text[_pos] == '-'))
        ++_pos;
      if (!_isDigit(_pos))
        return _fail("Invalid number format");
      while (_isDigit(_pos))
        ++_pos;
    }

    std::string_view numStr = _text.substr(start, _pos - start);
    if (!isFloat)
    {
      std::int64_t i = 0;
      auto result = std::from_chars(numStr.data(), numStr.data() + numStr.size(), i);
      if (result.ec == std::errc{})
      {
        out = Json(i);
        return true;
      }
    }

    // Out-of-range integers fall through to double; 1e999 becomes infinity
    out = Json(std::strtod(std::string(numStr).c_str(), nullptr));
    return true;
  }

  bool _parseHex4(std::uint32_t &cp)
  {
    if (_pos + 4 > _text.size())
      return false;
    cp = 0;
    for (std::size_t i = 0; i < 4; ++i)
    {
      char c = _text[_pos + i];
      cp <<= 4;
      if (c >= '0' && c <= '9')
        cp |= static_cast<std::uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f')
        cp |= static_cast<std::uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F')
        cp |= static_cast<std::uint32_t>(c - 'A' + 10);
      else
        return false;
    }
    _pos += 4;
    return true;
  }

  // Called with _pos on the 'u' of a \u escape; leaves _pos on the last hex digit
  bool _parseUnicodeEscape(std::string &str)
  {
    ++_pos;
    std::uint32_t cp = 0;
    if (!_parseHex4(cp))
      return _fail("Invalid unicode escape");

    if (cp >= 0xD800 && cp <= 0xDBFF)
    {
      std::size_t save = _pos;
      std::uint32_t low = 0;
      if (_pos + 1 < _text.size() && _text[_pos] == '\\' && _text[_pos + 1] == 'u')
      {
        _pos += 2;
        if (_parseHex4(low) && low >= 0xDC00 && low <= 0xDFFF)
        {
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        }
        else
        {
          _pos = save;
          cp = util::utf8::kReplacement;
        }
      }
      else
      {
        cp = util::utf8::kReplacement;
      }
    }
    else if (cp >= 0xDC00 && cp <= 0xDFFF)
    {
      cp = util::utf8::kReplacement;
    }

    util::utf8::append(str, static_cast<char32_t>(cp));
    --_pos;
    return true;
  }

  bool _parseString(std::string &str)
  {
    if (_pos >= _text.size() || _text[_pos] != '"')
      return _fail("Expected '\"'");
    ++_pos;

    while (_pos < _text.size() && _text[_pos] != '"')
    {
      if (str.size() > _limits.stringLengthMax)
        return _failLimit("String length exceeds limit");

      char c = _text[_pos];
      if (static_cast<unsigned char>(c) < 0x20)
        return _fail("Control character in string");

      if (c == '\\')
      {
        ++_pos;
        if (_pos >= _text.size())
          return _fail("Unexpected end of string");

        switch (_text[_pos])
        {
        case '"':
          str += '"';
          break;
        case '\\':
          str += '\\';
          break;
        case '/':
          str += '/';
          break;
        case 'b':
          str += '\b';
          break;
        case 'f':
          str += '\f';
          break;
        case 'n':
          str += '\n';
          break;
        case 'r':
          str += '\r';
          break;
        case 't':
          str += '\t';
          break;
        case 'u':
          if (!_parseUnicodeEscape(str))
            return false;
          break;
        default:
          return _fail("Invalid escape sequence");
        }
      }
      else if (static_cast<unsigned char>(c) >= 0x80)
      {
        char32_t cp = 0;
        std::size_t len = util::utf8::decodeOne(_text, _pos, cp);
        if (len == 0)
          return _fail("Invalid UTF-8 in string");
        str.append(_text.substr(_pos, len));
        _pos += len - 1;
      }
      else
      {
        str += c;
      }
      ++_pos;
    }

    if (_pos >= _text.size())
      return _fail("Unterminated string");

    ++_pos; // closing quote
    return true;
  }

  bool _parseArray(Json &out, std::size_t depth)
  {
    ++_pos; // '['
    Json::Array arr;
    _skipWhitespace();

    if (_pos < _text.size() && _text[_pos] == ']')
    {
      ++_pos;
      out = Json(std::move(arr));
      return true;
    }

    while (true)
    {
      if (arr.size() >= _limits.arrayItemsMax)
        return _failLimit("Array size exceeds limit");

      Json element;
      if (!_parseValue(element, depth + 1))
        return false;
      arr.push_back(std::move(element));

      _skipWhitespace();
      if (_pos >= _text.size())
        return _fail("Unexpected end of array");

      if (_text[_pos] == ']')
      {
        ++_pos;
        break;
      }
      if (_text[_pos] != ',')
        return _fail("Expected ',' or ']'");
      ++_pos;
    }

    out = Json(std::move(arr));
    return true;
  }

  bool _parseObject(Json &out, std::size_t depth)
  {
    ++_pos; // '{'
    Json::Object obj;
    _skipWhitespace();

    if (_pos < _text.size() && _text[_pos] == '}')
    {
      ++_pos;
      out = Json(std::move(obj));
      return true;
    }

    while (true)
    {
      if (obj.size() >= _limits.membersMax)
        return _failLimit("Object size exceeds limit");

      _skipWhitespace();
      std::string key;
      if (!_parseString(key))
        return false;

      _skipWhitespace();
      if (_pos >= _text.size() || _text[_pos] != ':')
        return _fail("Expected ':'");
      ++_pos;

      Json value;
      if (!_parseValue(value, depth + 1))
        return false;
      obj[std::move(key)] = std::move(value);

      _skipWhitespace();
      if (_pos >= _text.size())
        return _fail("Unexpected end of object");

      if (_text[_pos] == '}')
      {
        ++_pos;
        break;
      }
      if (_text[_pos] != ',')
        return _fail("Expected ',' or '}'");
      ++_pos;
    }

    out = Json(std::move(obj));
    return true;
  }
};

inline ParseResult Json::parse(std::string_view text, const ParseLimits &limits)
{
  JsonParser parser(text, limits);
  return parser.parse();
}

inline Json Json::parseOrThrow(std::string_view text, const ParseLimits &limits)
{
  auto result = parse(text, limits);
  if (!result.ok)
  {
    throw parse_error("JSON parse error at line " + std::to_string(result.error.where.line) +
                      ", column " + std::to_string(result.error.where.column) + ": " +
                      result.error.message);
  }
  return std::move(result.value);
}

} // namespace parsers
} // namespace jsonmend
