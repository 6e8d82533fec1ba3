#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads the sweep plan (JSON) from the host FS.
 *
 *  © 2025 The ivbench authors — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/SweepPlan.hpp"

namespace ivbench::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to the caller.
 *
 *  * No caching — every call to `load()` re-reads the file (cheap, tiny file).
 *  * All schema validation lives in SweepPlan::fromJson().
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `ConfigurationError`.
    nlohmann::json load() const;

    /// load() + SweepPlan::fromJson().
    SweepPlan loadPlan() const;

    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

} // namespace ivbench::core
