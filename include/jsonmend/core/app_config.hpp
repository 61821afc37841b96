// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "jsonmend/core/config_loader.hpp"
#include "jsonmend/core/logger.hpp"
#include "jsonmend/jsonmend.hpp"
#include <algorithm>
#include <cstddef>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#define JSONMEND_DEFAULT_CONFIG_FILE_PATH "/etc/jsonmend/jsonmend.toml"

namespace jsonmend
{
namespace core
{

/// \brief Settings for the jsonmend command-line tool.
///
/// Every field is optional so that command-line values, applied first, are
/// not overwritten by the configuration file.
struct AppConfig
{
  std::optional<std::string> configFile;
  std::optional<std::string> inputFile;
  std::optional<std::string> outputFile;

  struct LogConfig
  {
    std::optional<std::string> level;
    std::optional<std::string> file;
    std::optional<std::string> format;
  } log;

  struct OutputConfig
  {
    std::optional<bool> pretty;
    std::optional<int> indent;
    std::optional<bool> sortKeys;
  } output;

  struct RepairConfig
  {
    std::optional<bool> explain;
    std::optional<bool> check;
    std::optional<std::size_t> maxDepth;
  } repair;

  /// Keys found in the configuration file that jsonmend does not read.
  std::vector<std::string> ignoredConfigKeys;

  bool showHelp{false};
};

/// \brief Every key applyTomlConfig() reads.
inline const std::vector<std::string> &knownConfigKeys()
{
  static const std::vector<std::string> keys = {
    "jsonmend.log.level",      "jsonmend.log.file",        "jsonmend.log.format",
    "jsonmend.output.pretty",  "jsonmend.output.indent",   "jsonmend.output.sortKeys",
    "jsonmend.repair.explain", "jsonmend.repair.maxDepth",
  };
  return keys;
}

inline void printHelp(std::ostream &os)
{
  os << "Usage: jsonmend [options]\n"
     << "Repairs malformed JSON read from a file or stdin.\n\n"
     << "Options:\n"
     << "  -h, --help                Show this help message\n"
     << "  -c, --config <file>       Configuration file path (default: "
     << JSONMEND_DEFAULT_CONFIG_FILE_PATH << ")\n"
     << "  -i, --input <file>        Read input from file (default: stdin)\n"
     << "  -o, --output <file>       Write output to file (default: stdout)\n"
     << "  -l, --log-level <level>   Log level (trace, debug, info, warning, "
        "error, fatal)\n"
     << "  -f, --log-file <file>     Log file path (default: stderr)\n"
     << "      --log-format <fmt>    Log line format (%T %t %L %m %F %l %f)\n"
     << "      --indent <n>          Spaces per indentation level (default: 2)\n"
     << "      --compact             Write the result on a single line\n"
     << "      --no-sort-keys        Keep object keys unsorted\n"
     << "      --max-depth <n>       Nesting limit while repairing (default: "
     << recovery::kDefaultMaxDepth << ")\n"
     << "      --explain             Log each repair decision at info level\n"
     << "      --check               Exit with status 2 if the input needed "
        "repair\n";
}

namespace detail
{
inline long parseNonNegative(const std::string &text, const std::string &what)
{
  std::size_t used = 0;
  long value = -1;
  try
  {
    value = std::stol(text, &used);
  }
  catch (const std::exception &)
  {
    throw std::runtime_error("Invalid " + what + ": " + text);
  }
  if (used != text.size() || value < 0)
  {
    throw std::runtime_error("Invalid " + what + ": " + text);
  }
  return value;
}
} // namespace detail

/// \brief Apply command-line arguments to \p config.
/// \throws std::runtime_error on an unknown option, a missing argument or an
/// invalid number
inline void parseCliArgs(int argc, const char *const *argv, AppConfig &config)
{
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    auto requireValue = [&]() -> std::string
    {
      if (i + 1 >= argc)
      {
        throw std::runtime_error("Missing value for option: " + arg);
      }
      return argv[++i];
    };

    if (arg == "-h" || arg == "--help")
    {
      config.showHelp = true;
    }
    else if (arg == "-c" || arg == "--config")
    {
      config.configFile = requireValue();
    }
    else if (arg == "-i" || arg == "--input")
    {
      config.inputFile = requireValue();
    }
    else if (arg == "-o" || arg == "--output")
    {
      config.outputFile = requireValue();
    }
    else if (arg == "-l" || arg == "--log-level")
    {
      config.log.level = requireValue();
    }
    else if (arg == "-f" || arg == "--log-file")
    {
      config.log.file = requireValue();
    }
    else if (arg == "--log-format")
    {
      config.log.format = requireValue();
    }
    else if (arg == "--indent")
    {
      config.output.indent = static_cast<int>(detail::parseNonNegative(requireValue(), "indent"));
    }
    else if (arg == "--compact")
    {
      config.output.pretty = false;
    }
    else if (arg == "--no-sort-keys")
    {
      config.output.sortKeys = false;
    }
    else if (arg == "--max-depth")
    {
      config.repair.maxDepth =
        static_cast<std::size_t>(detail::parseNonNegative(requireValue(), "max depth"));
    }
    else if (arg == "--explain")
    {
      config.repair.explain = true;
    }
    else if (arg == "--check")
    {
      config.repair.check = true;
    }
    else
    {
      throw std::runtime_error("Unknown option: " + arg);
    }
  }
}

/// \brief Fill every field of \p config not set on the command line from
/// \p loader.
inline void applyTomlConfig(AppConfig &config, const ConfigLoader &loader)
{
  if (!config.log.level)
  {
    config.log.level = loader.getString("jsonmend.log.level");
  }
  if (!config.log.file)
  {
    config.log.file = loader.getString("jsonmend.log.file");
  }
  if (!config.log.format)
  {
    config.log.format = loader.getString("jsonmend.log.format");
  }
  if (!config.output.pretty)
  {
    config.output.pretty = loader.getBool("jsonmend.output.pretty");
  }
  if (!config.output.indent)
  {
    if (auto indent = loader.getInt("jsonmend.output.indent"))
    {
      if (*indent < 0)
      {
        throw std::runtime_error("Invalid jsonmend.output.indent: " + std::to_string(*indent));
      }
      config.output.indent = static_cast<int>(*indent);
    }
  }
  if (!config.output.sortKeys)
  {
    config.output.sortKeys = loader.getBool("jsonmend.output.sortKeys");
  }
  if (!config.repair.explain)
  {
    config.repair.explain = loader.getBool("jsonmend.repair.explain");
  }
  if (!config.repair.maxDepth)
  {
    if (auto depth = loader.getInt("jsonmend.repair.maxDepth"))
    {
      if (*depth < 0)
      {
        throw std::runtime_error("Invalid jsonmend.repair.maxDepth: " + std::to_string(*depth));
      }
      config.repair.maxDepth = static_cast<std::size_t>(*depth);
    }
  }

  const auto &known = knownConfigKeys();
  for (auto &key : loader.keys())
  {
    if (std::find(known.begin(), known.end(), key) == known.end())
    {
      config.ignoredConfigKeys.push_back(std::move(key));
    }
  }
}

/// \brief Load the configuration file named in \p config, or the default one
/// if it exists.
/// \throws std::runtime_error if an explicitly named file cannot be loaded
inline void loadConfigFile(AppConfig &config)
{
  if (config.configFile)
  {
    ConfigLoader loader(*config.configFile);
    loader.load();
    applyTomlConfig(config, loader);
    return;
  }

  ConfigLoader loader(JSONMEND_DEFAULT_CONFIG_FILE_PATH);
  if (loader.isLoaded())
  {
    applyTomlConfig(config, loader);
  }
}

/// \brief Initialize core::Logger from \p config.
/// \throws std::runtime_error on an unknown level name
inline void applyLogConfig(const AppConfig &config)
{
  Logger::Level level = Logger::Level::Warning;
  if (config.log.level)
  {
    auto parsed = Logger::levelFromString(*config.log.level);
    if (!parsed)
    {
      throw std::runtime_error("Invalid log level: " + *config.log.level);
    }
    level = *parsed;
  }
  if (config.repair.explain.value_or(false) && level > Logger::Level::Info)
  {
    level = Logger::Level::Info;
  }

  Logger::init(level, config.log.file.value_or(""));
  if (config.log.format)
  {
    Logger::setLogFormat(*config.log.format);
  }
}

/// \brief Repair options described by \p config.
inline RepairOptions toRepairOptions(const AppConfig &config)
{
  RepairOptions options;
  options.output.pretty = config.output.pretty.value_or(true);
  options.output.indent = std::string(static_cast<std::size_t>(config.output.indent.value_or(2)), ' ');
  options.output.sortKeys = config.output.sortKeys.value_or(true);
  options.maxDepth = config.repair.maxDepth.value_or(recovery::kDefaultMaxDepth);
  return options;
}

} // namespace core
} // namespace jsonmend
