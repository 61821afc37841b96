// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <vector>

namespace jsonmend
{
namespace recovery
{

/// \brief What the recovery parser is currently reading.
enum class Context
{
  ObjectKey,
  ObjectValue,
  Array
};

inline const char *contextToString(Context context)
{
  switch (context)
  {
  case Context::ObjectKey:
    return "ObjectKey";
  case Context::ObjectValue:
    return "ObjectValue";
  case Context::Array:
    return "Array";
  }
  return "Unknown";
}

/// \brief Stack of open structures, innermost on top.
///
/// The top is consulted to decide where an unquoted token ends. Depth always
/// equals the number of objects/arrays the parser is inside.
class ContextStack
{
public:
  /// \brief Pushes on construction, pops on destruction.
  class Scope
  {
  public:
    Scope(ContextStack &stack, Context context) : _stack(stack) { _stack.push(context); }
    ~Scope() { _stack.pop(); }

    Scope(const Scope &) = delete;
    Scope &operator=(const Scope &) = delete;

  private:
    ContextStack &_stack;
  };

  void push(Context context) { _stack.push_back(context); }

  void pop()
  {
    if (!_stack.empty())
    {
      _stack.pop_back();
    }
  }

  std::optional<Context> current() const
  {
    if (_stack.empty())
    {
      return std::nullopt;
    }
    return _stack.back();
  }

  /// \brief Change the innermost context in place (key to value and back).
  /// \throws std::logic_error on an empty stack
  void replaceTop(Context context)
  {
    if (_stack.empty())
    {
      throw std::logic_error("ContextStack::replaceTop on empty stack");
    }
    _stack.back() = context;
  }

  std::size_t depth() const { return _stack.size(); }
  bool empty() const { return _stack.empty(); }

private:
  std::vector<Context> _stack;
};

} // namespace recovery
} // namespace jsonmend
