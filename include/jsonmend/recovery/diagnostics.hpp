// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include "jsonmend/core/logger.hpp"

namespace jsonmend
{
namespace recovery
{

/// \brief Kinds of recovery decision the parser reports.
enum class DiagnosticKind
{
  GarbageSkipped,     ///< Code points that start no value were dropped
  UnquotedString,     ///< Token read without quotes
  UnterminatedString, ///< Quoted string ran to end of input
  UnknownEscape,      ///< Escape kept verbatim as two characters
  MissingColon,       ///< Object key not followed by ':'
  MissingComma,       ///< Two members/elements without a separating ','
  UnterminatedObject, ///< Object closed implicitly
  UnterminatedArray,  ///< Array closed implicitly
  EmptyValue,         ///< Input ended where a value was due, null substituted
  UnparsableKey,      ///< Key scan made no progress
  DuplicateKey,       ///< Later member replaced an earlier one
  NumberAsString,     ///< Numeric run could not be converted
  ExtraValues,        ///< More than one top-level value recovered
  DepthExceeded       ///< Opening bracket beyond the nesting limit was dropped
};

inline const char *diagnosticKindToString(DiagnosticKind kind)
{
  switch (kind)
  {
  case DiagnosticKind::GarbageSkipped:
    return "GarbageSkipped";
  case DiagnosticKind::UnquotedString:
    return "UnquotedString";
  case DiagnosticKind::UnterminatedString:
    return "UnterminatedString";
  case DiagnosticKind::UnknownEscape:
    return "UnknownEscape";
  case DiagnosticKind::MissingColon:
    return "MissingColon";
  case DiagnosticKind::MissingComma:
    return "MissingComma";
  case DiagnosticKind::UnterminatedObject:
    return "UnterminatedObject";
  case DiagnosticKind::UnterminatedArray:
    return "UnterminatedArray";
  case DiagnosticKind::EmptyValue:
    return "EmptyValue";
  case DiagnosticKind::UnparsableKey:
    return "UnparsableKey";
  case DiagnosticKind::DuplicateKey:
    return "DuplicateKey";
  case DiagnosticKind::NumberAsString:
    return "NumberAsString";
  case DiagnosticKind::ExtraValues:
    return "ExtraValues";
  case DiagnosticKind::DepthExceeded:
    return "DepthExceeded";
  }
  return "Unknown";
}

/// \brief One recovery decision.
struct Diagnostic
{
  DiagnosticKind kind;
  std::size_t offset{0}; ///< Code-point index into the input
  std::string detail;
};

inline std::string toString(const Diagnostic &diagnostic)
{
  std::string out = diagnosticKindToString(diagnostic.kind);
  out += " at ";
  out += std::to_string(diagnostic.offset);
  if (!diagnostic.detail.empty())
  {
    out += ": ";
    out += diagnostic.detail;
  }
  return out;
}

/// \brief Receiver of recovery diagnostics.
///
/// A sink may be shared by parsers running on different threads, so
/// implementations must tolerate concurrent record() calls.
class DiagnosticSink
{
public:
  virtual ~DiagnosticSink() = default;
  virtual void record(const Diagnostic &diagnostic) = 0;
};

/// \brief Discards everything.
class NullSink : public DiagnosticSink
{
public:
  void record(const Diagnostic &) override {}

  static NullSink &instance()
  {
    static NullSink sink;
    return sink;
  }
};

/// \brief Keeps every diagnostic in arrival order.
class CollectingSink : public DiagnosticSink
{
public:
  void record(const Diagnostic &diagnostic) override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _diagnostics.push_back(diagnostic);
  }

  std::vector<Diagnostic> diagnostics() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _diagnostics;
  }

  std::size_t size() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _diagnostics.size();
  }

  std::size_t count(DiagnosticKind kind) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    std::size_t n = 0;
    for (const auto &d : _diagnostics)
    {
      if (d.kind == kind)
      {
        ++n;
      }
    }
    return n;
  }

  void clear()
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _diagnostics.clear();
  }

private:
  mutable std::mutex _mutex;
  std::vector<Diagnostic> _diagnostics;
};

/// \brief Writes each diagnostic to core::Logger.
class LoggerSink : public DiagnosticSink
{
public:
  explicit LoggerSink(core::Logger::Level level = core::Logger::Level::Debug) : _level(level) {}

  void record(const Diagnostic &diagnostic) override
  {
    if (core::Logger::isEnabled(_level))
    {
      core::Logger::log(_level, "[repair] " + toString(diagnostic));
    }
  }

  core::Logger::Level level() const { return _level; }

private:
  core::Logger::Level _level;
};

} // namespace recovery
} // namespace jsonmend
