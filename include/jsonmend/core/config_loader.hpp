// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <jsonmend/parsers/minimal_toml.hpp>
#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace jsonmend
{
namespace core
{
/// \brief A jsonmend TOML configuration file and its dotted-key settings.
///
/// Construction never throws; a missing or malformed file leaves the loader
/// empty with the failure reason available from lastError(). Call load() to
/// turn that failure into an exception.
///
/// Lookups distinguish an absent key (std::nullopt) from a key holding the
/// wrong kind of value, which throws so that `indent = "wide"` is reported
/// instead of silently falling back to the default.
class ConfigLoader
{
public:
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { reload(); }

  /// \brief Re-read the file from disk.
  /// \return false if the file could not be opened or parsed
  bool reload()
  {
    try
    {
      _table = parsers::toml::parse_file(_filename);
      _loaded = true;
      _lastError.clear();
    }
    catch (const std::exception &e)
    {
      _table = parsers::toml::table{};
      _loaded = false;
      _lastError = e.what();
    }
    return _loaded;
  }

  /// \brief The parsed table.
  /// \throws std::runtime_error if the file failed to load
  const parsers::toml::table &load() const
  {
    if (!_loaded)
    {
      throw std::runtime_error("Failed to load configuration file: " + _filename + " (" +
                               _lastError + ")");
    }
    return _table;
  }

  bool isLoaded() const { return _loaded; }

  const std::string &lastError() const { return _lastError; }

  const std::string &filename() const { return _filename; }

  const parsers::toml::table &table() const { return _table; }

  /// \brief Setting at \p dottedKey, or std::nullopt if it is not set.
  /// \tparam T int64_t, double, bool or std::string
  /// \throws std::runtime_error if the key holds another kind of value
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (!node)
    {
      return std::nullopt;
    }
    if (node.is_value())
    {
      if (auto val = node.as<T>())
      {
        return val;
      }
    }
    throw std::runtime_error("Config key '" + dottedKey + "' in " + _filename + " must be " +
                             _kindName<T>());
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief Dotted paths of every non-table entry, sorted.
  std::vector<std::string> keys() const
  {
    std::vector<std::string> out;
    _collectKeys(_table, std::string(), out);
    std::sort(out.begin(), out.end());
    return out;
  }

private:
  std::string _filename;
  parsers::toml::table _table;
  bool _loaded{false};
  std::string _lastError;

  template <typename T> static const char *_kindName()
  {
    if constexpr (std::is_same_v<T, bool>)
      return "a boolean";
    else if constexpr (std::is_same_v<T, double>)
      return "a number";
    else if constexpr (std::is_integral_v<T>)
      return "an integer";
    else
      return "a string";
  }

  static void _collectKeys(const parsers::toml::table &tbl, const std::string &prefix,
                           std::vector<std::string> &out)
  {
    for (const auto &entry : tbl)
    {
      std::string path = prefix.empty() ? entry.first : prefix + "." + entry.first;
      if (const auto *child = entry.second.as_table())
      {
        _collectKeys(*child, path, out);
      }
      else
      {
        out.push_back(std::move(path));
      }
    }
  }
};

} // namespace core
} // namespace jsonmend
