// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file recovery_parser.hpp
/// \brief Error-tolerant JSON parser.
///
/// RecoveryParser reads text that is not valid JSON and reconstructs the most
/// plausible value from it. It never fails: missing quotes, colons, commas and
/// closing brackets are inferred, stray characters are skipped, and several
/// concatenated values are returned as a sequence.
///
/// Scanning works on Unicode code points. A context stack records whether
/// the parser is reading an object key, an object value or an array element;
/// the innermost context decides where an unquoted token ends:
///
///   context        unquoted token ends at
///   ObjectKey      ':'
///   ObjectValue    ',' '}' ']'
///   Array          ',' '}' ']'
///   (top level)    ',' '}' ']' ':'
///
/// Bare words outside any structure are skipped as prose rather than read as
/// unquoted strings, so top-level `truthy` yields no value.
///
/// Each recovery decision is reported to a DiagnosticSink; sinks observe the
/// parse and never change its result.

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "jsonmend/parsers/json.hpp"
#include "jsonmend/recovery/context_stack.hpp"
#include "jsonmend/recovery/diagnostics.hpp"
#include "jsonmend/util/utf8.hpp"

namespace jsonmend
{
namespace recovery
{

inline constexpr std::size_t kDefaultMaxDepth = 512;

/// \brief Options for a RecoveryParser.
struct ParserOptions
{
  /// Receives recovery diagnostics; nullptr discards them. Not owned.
  DiagnosticSink *sink{nullptr};

  /// Objects/arrays nested deeper than this are not entered.
  std::size_t maxDepth{kDefaultMaxDepth};

  /// \brief Install \p diagnosticSink, which must outlive every parser built
  /// from these options.
  ParserOptions &withLogger(DiagnosticSink &diagnosticSink)
  {
    sink = &diagnosticSink;
    return *this;
  }

  ParserOptions &withMaxDepth(std::size_t depth)
  {
    maxDepth = depth;
    return *this;
  }
};

/// \brief Outcome of one recovery pass: nothing, one value, or several.
class RecoveredValue
{
public:
  enum class Kind
  {
    None,
    Single,
    Sequence
  };

  RecoveredValue() = default;
  explicit RecoveredValue(parsers::Json value) : _value(std::move(value)) {}
  explicit RecoveredValue(std::vector<parsers::Json> values) : _value(std::move(values)) {}

  Kind kind() const { return static_cast<Kind>(_value.index()); }

  bool isNone() const { return kind() == Kind::None; }
  bool isSingle() const { return kind() == Kind::Single; }
  bool isSequence() const { return kind() == Kind::Sequence; }

  /// \brief Number of top-level values recovered.
  std::size_t count() const
  {
    switch (kind())
    {
    case Kind::None:
      return 0;
    case Kind::Single:
      return 1;
    case Kind::Sequence:
      return std::get<std::vector<parsers::Json>>(_value).size();
    }
    return 0;
  }

  /// \throws std::logic_error unless kind() is Single
  const parsers::Json &value() const
  {
    if (auto *single = std::get_if<parsers::Json>(&_value))
    {
      return *single;
    }
    throw std::logic_error("RecoveredValue does not hold a single value");
  }

  /// \throws std::logic_error unless kind() is Sequence
  const std::vector<parsers::Json> &sequence() const
  {
    if (auto *values = std::get_if<std::vector<parsers::Json>>(&_value))
    {
      return *values;
    }
    throw std::logic_error("RecoveredValue does not hold a sequence");
  }

  /// \brief None as null, Single as itself, Sequence as an array.
  parsers::Json toJson() const
  {
    switch (kind())
    {
    case Kind::None:
      return parsers::Json();
    case Kind::Single:
      return value();
    case Kind::Sequence:
      return parsers::Json(sequence());
    }
    return parsers::Json();
  }

private:
  std::variant<std::monostate, parsers::Json, std::vector<parsers::Json>> _value;
};

/// \brief Single-use recovery parser over one input text.
///
/// Not thread-safe; use one instance per input. Distinct instances share
/// nothing and may run concurrently.
class RecoveryParser
{
public:
  explicit RecoveryParser(std::string_view text, const ParserOptions &options = {})
      : _text(util::utf8::decode(text)),
        _sink(options.sink ? options.sink : &NullSink::instance()),
        _maxDepth(options.maxDepth)
  {
  }

  RecoveryParser(const RecoveryParser &) = delete;
  RecoveryParser &operator=(const RecoveryParser &) = delete;
  RecoveryParser(RecoveryParser &&) = default;
  RecoveryParser &operator=(RecoveryParser &&) = default;

  /// \brief Recover every top-level value in the input.
  /// \throws std::logic_error when called a second time
  RecoveredValue parse()
  {
    if (_consumed)
    {
      throw std::logic_error("RecoveryParser::parse called twice");
    }
    _consumed = true;

    std::vector<parsers::Json> values;
    while (true)
    {
      _skipWhitespace();
      if (_pos >= _text.size())
      {
        break;
      }

      std::size_t before = _pos;
      if (auto value = _parseValue())
      {
        values.push_back(std::move(*value));
      }
      else if (_pos == before)
      {
        ++_pos;
      }
    }

    if (values.empty())
    {
      return RecoveredValue();
    }
    if (values.size() == 1)
    {
      return RecoveredValue(std::move(values.front()));
    }
    _report(DiagnosticKind::ExtraValues, _text.size(),
            std::to_string(values.size()) + " top-level values");
    return RecoveredValue(std::move(values));
  }

  /// \brief Cursor position, in code points.
  std::size_t position() const { return _pos; }

  /// \brief Input length, in code points.
  std::size_t length() const { return _text.size(); }

private:
  std::u32string _text;
  std::size_t _pos{0};
  ContextStack _context;
  DiagnosticSink *_sink;
  std::size_t _maxDepth;
  bool _consumed{false};

  static constexpr std::size_t kNoGarbage = static_cast<std::size_t>(-1);
  static constexpr std::size_t kExcerptMax = 40;

  std::optional<char32_t> _peek(std::size_t offset = 0) const
  {
    if (_pos + offset >= _text.size())
    {
      return std::nullopt;
    }
    return _text[_pos + offset];
  }

  void _skipWhitespace()
  {
    while (_pos < _text.size() && util::utf8::isSpace(_text[_pos]))
    {
      ++_pos;
    }
  }

  void _report(DiagnosticKind kind, std::size_t offset, std::string detail = {})
  {
    _sink->record(Diagnostic{kind, offset, std::move(detail)});
  }

  std::string _excerpt(std::size_t from, std::size_t to) const
  {
    std::u32string_view view(_text);
    std::size_t count = to - from;
    std::string out = util::utf8::encode(view.substr(from, std::min(count, kExcerptMax)));
    if (count > kExcerptMax)
    {
      out += "...";
    }
    return out;
  }

  /// \brief Report the pending garbage run [garbageStart, end), if any.
  void _flushGarbage(std::size_t &garbageStart, std::size_t end)
  {
    if (garbageStart != kNoGarbage)
    {
      _report(DiagnosticKind::GarbageSkipped, garbageStart, _excerpt(garbageStart, end));
      garbageStart = kNoGarbage;
    }
  }

  /// \brief Parse one value, skipping anything that cannot start one.
  /// \return std::nullopt only when the input ends first
  std::optional<parsers::Json> _parseValue()
  {
    std::size_t garbageStart = kNoGarbage;
    while (true)
    {
      _skipWhitespace();
      auto c = _peek();
      if (!c)
      {
        _flushGarbage(garbageStart, _pos);
        return std::nullopt;
      }

      const char32_t ch = *c;
      if ((ch == U'{' || ch == U'[') && _context.depth() >= _maxDepth)
      {
        _flushGarbage(garbageStart, _pos);
        _report(DiagnosticKind::DepthExceeded, _pos);
        garbageStart = _pos++;
        continue;
      }

      if (ch == U'{')
      {
        _flushGarbage(garbageStart, _pos);
        ++_pos;
        return _parseObject();
      }
      if (ch == U'[')
      {
        _flushGarbage(garbageStart, _pos);
        ++_pos;
        return _parseArray();
      }
      if (ch == U'"' || ch == U'\'')
      {
        _flushGarbage(garbageStart, _pos);
        return parsers::Json(_parseString());
      }
      if (util::utf8::isAsciiDigit(ch) || ch == U'-')
      {
        _flushGarbage(garbageStart, _pos);
        return _parseNumber();
      }
      if (ch == U't' || ch == U'f' || ch == U'n')
      {
        std::size_t start = _pos;
        if (auto literal = _matchLiteral())
        {
          _flushGarbage(garbageStart, start);
          return literal;
        }
        // Outside any structure a word that is not a literal is prose
        if (!_context.empty())
        {
          _flushGarbage(garbageStart, _pos);
          return parsers::Json(_parseString());
        }
      }
      else if (util::utf8::isLetter(ch) && !_context.empty())
      {
        _flushGarbage(garbageStart, _pos);
        return parsers::Json(_parseString());
      }

      if (garbageStart == kNoGarbage)
      {
        garbageStart = _pos;
      }
      ++_pos;
    }
  }

  std::optional<parsers::Json> _parseObject()
  {
    ContextStack::Scope scope(_context, Context::ObjectKey);
    parsers::Json::Object obj;

    while (true)
    {
      _skipWhitespace();
      auto c = _peek();
      if (!c || *c == U'}')
      {
        break;
      }
      if (*c == U',')
      {
        ++_pos;
        continue;
      }

      _context.replaceTop(Context::ObjectKey);
      std::size_t keyStart = _pos;
      std::string key = _parseString();
      _skipWhitespace();

      if (_pos == keyStart && _peek() != U':')
      {
        _report(DiagnosticKind::UnparsableKey, _pos);
        if (_peek() == U'}')
        {
          break;
        }
        ++_pos;
        continue;
      }

      if (obj.find(key) != obj.end())
      {
        _report(DiagnosticKind::DuplicateKey, keyStart, key);
      }

      if (_peek() == U':')
      {
        ++_pos;
      }
      else
      {
        _report(DiagnosticKind::MissingColon, _pos, key);
      }

      _context.replaceTop(Context::ObjectValue);
      // Input ran out before the value; the key is kept with null
      auto value = _parseValue();
      if (!value)
      {
        _report(DiagnosticKind::EmptyValue, _pos, key);
        value = parsers::Json();
      }
      obj[key] = std::move(*value);

      _skipWhitespace();
      auto next = _peek();
      if (next == U',')
      {
        ++_pos;
      }
      else if (next == U'}')
      {
        break;
      }
      else if (next)
      {
        _report(DiagnosticKind::MissingComma, _pos);
      }
    }

    if (_peek() == U'}')
    {
      ++_pos;
    }
    else
    {
      _report(DiagnosticKind::UnterminatedObject, _pos);
    }
    return parsers::Json(std::move(obj));
  }

  std::optional<parsers::Json> _parseArray()
  {
    ContextStack::Scope scope(_context, Context::Array);
    parsers::Json::Array arr;

    while (true)
    {
      _skipWhitespace();
      auto c = _peek();
      if (!c || *c == U']')
      {
        break;
      }
      if (*c == U',')
      {
        ++_pos;
        continue;
      }

      auto value = _parseValue();
      if (!value)
      {
        _report(DiagnosticKind::EmptyValue, _pos);
        arr.push_back(parsers::Json());
        break;
      }
      arr.push_back(std::move(*value));

      _skipWhitespace();
      auto next = _peek();
      if (next == U',')
      {
        ++_pos;
      }
      else if (next == U']')
      {
        break;
      }
      else if (next)
      {
        _report(DiagnosticKind::MissingComma, _pos);
      }
    }

    if (_peek() == U']')
    {
      ++_pos;
    }
    else
    {
      _report(DiagnosticKind::UnterminatedArray, _pos);
    }
    return parsers::Json(std::move(arr));
  }

  bool _endsUnquoted(char32_t c) const
  {
    auto context = _context.current();
    // _parseValue drops bare words outside any structure as prose, so with
    // the current dispatcher an empty stack only reaches here for quoted
    // strings, which never consult this rule
    if (!context)
    {
      return c == U',' || c == U'}' || c == U']' || c == U':';
    }
    if (*context == Context::ObjectKey)
    {
      return c == U':';
    }
    return c == U',' || c == U'}' || c == U']';
  }

  /// \brief Quoted or unquoted string; never fails.
  std::string _parseString()
  {
    _skipWhitespace();
    auto first = _peek();
    if (!first)
    {
      return std::string();
    }

    const bool quoted = *first == U'"' || *first == U'\'';
    const char32_t quote = *first;
    if (quoted)
    {
      ++_pos;
    }
    else
    {
      _report(DiagnosticKind::UnquotedString, _pos);
    }

    std::u32string out;
    while (true)
    {
      auto c = _peek();
      if (!c)
      {
        if (quoted)
        {
          _report(DiagnosticKind::UnterminatedString, _pos);
        }
        break;
      }

      if (*c == U'\\')
      {
        ++_pos;
        auto escaped = _peek();
        if (!escaped)
        {
          break; // trailing backslash
        }
        switch (*escaped)
        {
        case U'"':
        case U'\\':
        case U'/':
        case U'\'':
          out += *escaped;
          break;
        case U'b':
          out += U'\b';
          break;
        case U'f':
          out += U'\f';
          break;
        case U'n':
          out += U'\n';
          break;
        case U'r':
          out += U'\r';
          break;
        case U't':
          out += U'\t';
          break;
        default:
          _report(DiagnosticKind::UnknownEscape, _pos - 1);
          out += U'\\';
          out += *escaped;
          break;
        }
        ++_pos;
        continue;
      }

      if (quoted && *c == quote)
      {
        ++_pos;
        return util::utf8::encode(out);
      }
      if (!quoted && _endsUnquoted(*c))
      {
        break;
      }

      out += *c;
      ++_pos;
    }

    if (!quoted)
    {
      while (!out.empty() && util::utf8::isSpace(out.back()))
      {
        out.pop_back();
      }
    }
    return util::utf8::encode(out);
  }

  /// \brief Maximal run of digits, '.', '-', 'e', 'E' as a number, or as a
  /// string when it does not convert.
  std::optional<parsers::Json> _parseNumber()
  {
    std::size_t start = _pos;
    std::string run;
    while (auto c = _peek())
    {
      if (!util::utf8::isAsciiDigit(*c) && *c != U'.' && *c != U'-' && *c != U'e' && *c != U'E')
      {
        break;
      }
      run += static_cast<char>(*c);
      ++_pos;
    }

    const char *begin = run.c_str();
    const char *end = begin + run.size();
    if (run.find_first_of(".eE") != std::string::npos)
    {
      char *parsedEnd = nullptr;
      double d = std::strtod(begin, &parsedEnd);
      if (parsedEnd == end && std::isfinite(d))
      {
        return parsers::Json(d);
      }
    }
    else
    {
      std::int64_t i = 0;
      auto result = std::from_chars(begin, end, i);
      if (result.ec == std::errc{} && result.ptr == end)
      {
        return parsers::Json(i);
      }
    }

    _report(DiagnosticKind::NumberAsString, start, run);
    return parsers::Json(run);
  }

  bool _matchWord(std::u32string_view word) const
  {
    if (_text.compare(_pos, word.size(), word) != 0)
    {
      return false;
    }
    std::size_t after = _pos + word.size();
    return after >= _text.size() || !util::utf8::isIdentifierChar(_text[after]);
  }

  /// \brief true, false or null at the cursor, followed by a non-identifier
  /// code point. Leaves the cursor alone on a miss.
  std::optional<parsers::Json> _matchLiteral()
  {
    if (_matchWord(U"true"))
    {
      _pos += 4;
      return parsers::Json(true);
    }
    if (_matchWord(U"false"))
    {
      _pos += 5;
      return parsers::Json(false);
    }
    if (_matchWord(U"null"))
    {
      _pos += 4;
      return parsers::Json(nullptr);
    }
    return std::nullopt;
  }
};

/// \brief Construct a parser for \p text.
inline RecoveryParser newParser(std::string_view text, const ParserOptions &options = {})
{
  return RecoveryParser(text, options);
}

} // namespace recovery
} // namespace jsonmend
