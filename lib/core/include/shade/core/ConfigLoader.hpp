#ifndef SHADE_CORE_CONFIG_LOADER_HPP
#define SHADE_CORE_CONFIG_LOADER_HPP

#include <string>

#include <nlohmann/json.hpp>

#include "shade/core/ShadeConfig.hpp"
#include "shade/util/Error.hpp"

namespace SHADE {

/**
 * @brief Loads ShadeConfig from JSON
 *
 * Missing keys keep their defaults. Keys with the wrong JSON type, an
 * unknown log level or an unknown event kind produce INVALID_CONFIG.
 */
class ConfigLoader {
public:
  static Util::Result<ShadeConfig> LoadFromFile(const std::string &path);
  static Util::Result<ShadeConfig> LoadFromString(const std::string &text);
  static Util::Result<ShadeConfig> FromJson(const nlohmann::json &root);

  static nlohmann::json ToJson(const ShadeConfig &config);

  /// "DEBUG", "INFO", "WARN"/"WARNING", "ERROR" (case-sensitive)
  static bool ParseLogLevel(const std::string &text, Util::LogLevel &level);
};

} // namespace SHADE

#endif // SHADE_CORE_CONFIG_LOADER_HPP
