/* @file ConfigLoader.cpp
 * @brief reads + parses the JSON config file
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Autopilot headers
#include "core/ConfigLoader.hpp"
#include "core/Errors.hpp"

using namespace autopilot::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream f(path_);
  if (!f.is_open())
    throw ConfigurationError("[ConfigLoader] cannot open config file: " + path_);

  try {
    return nlohmann::json::parse(f);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigurationError("[ConfigLoader] " + path_ + ": " + e.what());
  }
}
