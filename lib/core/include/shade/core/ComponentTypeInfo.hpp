#ifndef SHADE_CORE_COMPONENT_TYPE_INFO_HPP
#define SHADE_CORE_COMPONENT_TYPE_INFO_HPP

#include <string>
#include <utility>

namespace SHADE {

/**
 * @brief Short and fully-qualified type name of a host component
 */
struct ComponentTypeInfo {
  std::string name;      ///< Short name (e.g., "Counter")
  std::string full_name; ///< Qualified name (e.g., "App.Pages.Counter")

  ComponentTypeInfo() = default;
  ComponentTypeInfo(std::string shortName, std::string fullName)
      : name(std::move(shortName)), full_name(std::move(fullName)) {}

  /// Derive the short name from the last '.' or "::" separated segment
  static ComponentTypeInfo FromFullName(const std::string &fullName) {
    auto pos = fullName.find_last_of(".:");
    if (pos == std::string::npos) {
      return ComponentTypeInfo(fullName, fullName);
    }
    return ComponentTypeInfo(fullName.substr(pos + 1), fullName);
  }

  bool operator==(const ComponentTypeInfo &other) const {
    return name == other.name && full_name == other.full_name;
  }
  bool operator!=(const ComponentTypeInfo &other) const {
    return !(*this == other);
  }
};

} // namespace SHADE

#endif // SHADE_CORE_COMPONENT_TYPE_INFO_HPP
