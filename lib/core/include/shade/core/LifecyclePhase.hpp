#ifndef SHADE_CORE_LIFECYCLE_PHASE_HPP
#define SHADE_CORE_LIFECYCLE_PHASE_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace SHADE {

/**
 * @brief Timed lifecycle phases of an enhanced component
 */
enum class LifecyclePhase : uint8_t {
  Initialize = 0,
  ParameterSet = 1,
  Render = 2,
  PostRender = 3,
  EventCallback = 4
};

constexpr size_t kLifecyclePhaseCount = 5;

/**
 * @brief Classification of one invalidation request
 */
enum class InvalidationOutcome : uint8_t {
  Honored = 0,                 ///< A render was queued
  SuppressedAlreadyQueued = 1, ///< A render was already pending
  SuppressedByPolicy = 2       ///< The component's render gate declined
};

inline std::string LifecyclePhaseToString(LifecyclePhase phase) {
  switch (phase) {
  case LifecyclePhase::Initialize:
    return "initialize";
  case LifecyclePhase::ParameterSet:
    return "parameter-set";
  case LifecyclePhase::Render:
    return "render";
  case LifecyclePhase::PostRender:
    return "post-render";
  case LifecyclePhase::EventCallback:
    return "event-callback";
  default:
    return "unknown";
  }
}

inline std::string InvalidationOutcomeToString(InvalidationOutcome outcome) {
  switch (outcome) {
  case InvalidationOutcome::Honored:
    return "honored";
  case InvalidationOutcome::SuppressedAlreadyQueued:
    return "suppressed-already-queued";
  case InvalidationOutcome::SuppressedByPolicy:
    return "suppressed-by-policy";
  default:
    return "unknown";
  }
}

} // namespace SHADE

#endif // SHADE_CORE_LIFECYCLE_PHASE_HPP
