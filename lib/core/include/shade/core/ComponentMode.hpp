#ifndef SHADE_CORE_COMPONENT_MODE_HPP
#define SHADE_CORE_COMPONENT_MODE_HPP

#include <cstdint>
#include <string>

namespace SHADE {

/**
 * @brief Instrumentation fidelity of a tracked component
 *
 * Enhanced components report their own lifecycle hooks. Basic components
 * are only discovered through host tree introspection.
 */
enum class ComponentMode : uint8_t {
  Enhanced = 0,
  Basic = 1
};

/**
 * @brief Record lifecycle inside the registry
 *
 *   Pending -> Resolved -> (removed)
 *
 * Disposal deletes the record, so there is no Disposed state.
 */
enum class LifecycleState : uint8_t {
  Pending = 0,  ///< Created locally, host id not yet known
  Resolved = 1  ///< Host id known and indexed
};

inline std::string ComponentModeToString(ComponentMode mode) {
  switch (mode) {
  case ComponentMode::Enhanced:
    return "Enhanced";
  case ComponentMode::Basic:
    return "Basic";
  default:
    return "Unknown";
  }
}

inline std::string LifecycleStateToString(LifecycleState state) {
  switch (state) {
  case LifecycleState::Pending:
    return "Pending";
  case LifecycleState::Resolved:
    return "Resolved";
  default:
    return "Unknown";
  }
}

} // namespace SHADE

#endif // SHADE_CORE_COMPONENT_MODE_HPP
