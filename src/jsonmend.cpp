// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonmend, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#include <jsonmend/core/app_config.hpp>
#include <jsonmend/jsonmend.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace
{
constexpr int kExitNeedsRepair = 2;

std::string readInput(const jsonmend::core::AppConfig &config)
{
  std::ostringstream buffer;
  if (config.inputFile)
  {
    std::ifstream file(*config.inputFile, std::ios::binary);
    if (!file.is_open())
    {
      throw std::runtime_error("Cannot open input file: " + *config.inputFile);
    }
    buffer << file.rdbuf();
  }
  else
  {
    buffer << std::cin.rdbuf();
  }
  return buffer.str();
}

void writeOutput(const jsonmend::core::AppConfig &config, const std::string &json)
{
  if (config.outputFile)
  {
    std::ofstream file(*config.outputFile, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
    {
      throw std::runtime_error("Cannot open output file: " + *config.outputFile);
    }
    file << json << '\n';
    if (!file)
    {
      throw std::runtime_error("Failed writing output file: " + *config.outputFile);
    }
  }
  else
  {
    std::cout << json << '\n';
    std::cout.flush();
  }
}
} // namespace

int main(int argc, char **argv)
{
  try
  {
    jsonmend::core::AppConfig config;
    jsonmend::core::parseCliArgs(argc, argv, config);
    if (config.showHelp)
    {
      jsonmend::core::printHelp(std::cout);
      return EXIT_SUCCESS;
    }

    jsonmend::core::loadConfigFile(config);
    jsonmend::core::applyLogConfig(config);
    if (config.configFile)
    {
      JSONMEND_LOG_DEBUG("Using config file: " << *config.configFile);
    }
    for (const auto &key : config.ignoredConfigKeys)
    {
      JSONMEND_LOG_WARN("Ignoring unknown configuration key: " << key);
    }

    std::string input = readInput(config);
    JSONMEND_LOG_DEBUG("Read " << input.size() << " bytes from "
                               << config.inputFile.value_or("stdin"));

    auto options = jsonmend::core::toRepairOptions(config);
    jsonmend::recovery::LoggerSink explainSink(jsonmend::core::Logger::Level::Info);
    if (config.repair.explain.value_or(false))
    {
      options.sink = &explainSink;
    }

    auto result = jsonmend::repair(input, options);
    if (!result.ok)
    {
      JSONMEND_LOG_ERROR(result.error);
      jsonmend::core::Logger::flush();
      return EXIT_FAILURE;
    }

    writeOutput(config, result.json);
    if (result.repaired)
    {
      JSONMEND_LOG_INFO("Repaired input, recovered " << result.valueCount << " value(s)");
    }
    jsonmend::core::Logger::flush();

    if (config.repair.check.value_or(false) && result.repaired)
    {
      return kExitNeedsRepair;
    }
  }
  catch (const std::exception &ex)
  {
    std::cerr << "jsonmend: " << ex.what() << std::endl;
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
