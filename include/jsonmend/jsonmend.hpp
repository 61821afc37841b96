// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "core/logger.hpp"
#include "parsers/json.hpp"
#include "recovery/context_stack.hpp"
#include "recovery/diagnostics.hpp"
#include "recovery/recovery_parser.hpp"
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

#define JSONMEND_VERSION "1.0.0"

namespace jsonmend
{
using parsers::Json;

/// \brief Options for repair() and load().
struct RepairOptions
{
  /// Output formatting; repaired JSON is indented and key-sorted by default.
  parsers::SerializeOptions output{true, true, "  "};

  /// Receives recovery diagnostics; not owned.
  recovery::DiagnosticSink *sink{nullptr};

  /// Nesting limit for the recovery parser.
  std::size_t maxDepth{recovery::kDefaultMaxDepth};

  /// \brief Limits for the strict fast-path parse.
  ///
  /// Nesting is bounded by maxDepth as in the recovery parser and sizes are
  /// not bounded at all, so valid input is only refused when it nests deeper
  /// than the recovery parser would keep.
  parsers::ParseLimits strictLimits() const
  {
    parsers::ParseLimits limits;
    limits.depthMax = maxDepth;
    limits.arrayItemsMax = std::numeric_limits<std::size_t>::max();
    limits.membersMax = std::numeric_limits<std::size_t>::max();
    limits.stringLengthMax = std::numeric_limits<std::size_t>::max();
    return limits;
  }

  recovery::ParserOptions parserOptions() const
  {
    recovery::ParserOptions options;
    options.sink = sink;
    options.maxDepth = maxDepth;
    return options;
  }
};

/// \brief Result of repair().
struct RepairResult
{
  std::string json;          ///< Repaired JSON text (empty if ok == false)
  bool ok{false};            ///< False only if the value cannot be written as JSON
  std::string error;         ///< Error message when ok == false
  bool repaired{false};      ///< True if the input was not valid JSON
  std::size_t valueCount{0}; ///< Top-level values recovered
};

/// \brief Thrown by repairOrThrow() when the recovered value cannot be written
/// as JSON text.
class RepairError : public std::runtime_error
{
public:
  explicit RepairError(const std::string &msg) : std::runtime_error(msg) {}
};

namespace detail
{
struct Recovery
{
  Json value;
  bool repaired{false};
  std::size_t valueCount{0};
};

inline Recovery recover(std::string_view text, const RepairOptions &options)
{
  Recovery outcome;
  auto strict = Json::parse(text, options.strictLimits());
  if (strict.ok)
  {
    JSONMEND_LOG_DEBUG("Input is valid JSON, skipping repair");
    outcome.value = std::move(strict.value);
    outcome.valueCount = 1;
    return outcome;
  }

  if (strict.error.limitExceeded)
  {
    JSONMEND_LOG_WARN("Input nests deeper than " << options.maxDepth
                                                 << " levels; deeper levels are dropped");
  }
  JSONMEND_LOG_DEBUG("Strict parse failed at line " << strict.error.where.line << " column "
                                                     << strict.error.where.column << ": "
                                                     << strict.error.message << "; repairing");
  auto parser = recovery::newParser(text, options.parserOptions());
  auto recovered = parser.parse();
  outcome.repaired = true;
  outcome.valueCount = recovered.count();
  outcome.value = recovered.toJson();
  JSONMEND_LOG_DEBUG("Recovered " << outcome.valueCount << " top-level value(s)");
  return outcome;
}
} // namespace detail

/// \brief Repair \p text and write it back as JSON.
///
/// Valid input is parsed strictly and re-serialized without running the
/// recovery parser. Anything else is recovered; several top-level values come
/// back as one array and no value at all as `null`.
inline RepairResult repair(std::string_view text, const RepairOptions &options = {})
{
  RepairResult result;
  auto outcome = detail::recover(text, options);
  result.repaired = outcome.repaired;
  result.valueCount = outcome.valueCount;
  try
  {
    result.json = outcome.value.serialize(options.output);
    result.ok = true;
  }
  catch (const Json::type_error &e)
  {
    result.error = std::string("failed to serialize ") +
                   (outcome.repaired ? "repaired" : "already-valid") + " JSON: " + e.what();
    JSONMEND_LOG_WARN(result.error);
  }
  return result;
}

/// \brief As repair(), returning the JSON text.
/// \throws RepairError if the value cannot be written as JSON
inline std::string repairOrThrow(std::string_view text, const RepairOptions &options = {})
{
  auto result = repair(text, options);
  if (!result.ok)
  {
    throw RepairError(result.error);
  }
  return std::move(result.json);
}

/// \brief Repair \p text and return the value itself.
///
/// Never fails; empty or hopeless input yields `null` and several top-level
/// values yield an array of them.
inline Json load(std::string_view text, const RepairOptions &options = {})
{
  return detail::recover(text, options).value;
}

} // namespace jsonmend
