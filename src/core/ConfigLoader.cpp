/* @file ConfigLoader.cpp
 * @brief JSON plan file reader
 *
 * © 2025 The ivbench authors — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <utility>

// Third-party headers
#include <nlohmann/json.hpp>

// ivbench headers
#include "core/ConfigLoader.hpp"
#include "core/Errors.hpp"

using namespace ivbench::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw ConfigurationError("[ConfigLoader] cannot open " + path_);

  try {
    // comments allowed: bench operators annotate their plans
    return nlohmann::json::parse(in, nullptr, true, true);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigurationError("[ConfigLoader] " + path_ + ": " + e.what());
  }
}

SweepPlan ConfigLoader::loadPlan() const {
  auto j = load();
  try {
    return SweepPlan::fromJson(j);
  } catch (const ConfigurationError& e) {
    throw ConfigurationError(std::string(e.what()) + " (in " + path_ + ")");
  }
}
