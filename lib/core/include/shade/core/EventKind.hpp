#ifndef SHADE_CORE_EVENT_KIND_HPP
#define SHADE_CORE_EVENT_KIND_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace SHADE {

/**
 * @brief Closed vocabulary of timeline event kinds
 *
 * The string form only exists at the query and configuration boundary.
 */
enum class EventKind : uint8_t {
  Initialize = 0,
  ParameterSet,
  Render,
  PostRender,
  Dispose,
  Invalidation,
  InvalidationSuppressed,
  CallbackInvoked,
  BatchStarted,
  BatchCompleted,
  BasicRender,
  SessionOpened,
  SessionClosed,
  Navigation
};

/**
 * @brief Probable cause attributed to a render event
 */
enum class TriggerReason : uint8_t {
  Unknown = 0,
  FirstRender,
  InvalidationCalled,
  CallbackInvoked,
  ParameterChanged,
  ParentRerendered
};

constexpr std::array<EventKind, 14> kAllEventKinds = {
    EventKind::Initialize,        EventKind::ParameterSet,
    EventKind::Render,            EventKind::PostRender,
    EventKind::Dispose,           EventKind::Invalidation,
    EventKind::InvalidationSuppressed, EventKind::CallbackInvoked,
    EventKind::BatchStarted,      EventKind::BatchCompleted,
    EventKind::BasicRender,       EventKind::SessionOpened,
    EventKind::SessionClosed,     EventKind::Navigation};

inline std::string EventKindToString(EventKind kind) {
  switch (kind) {
  case EventKind::Initialize:
    return "initialize";
  case EventKind::ParameterSet:
    return "parameter-set";
  case EventKind::Render:
    return "render";
  case EventKind::PostRender:
    return "post-render";
  case EventKind::Dispose:
    return "dispose";
  case EventKind::Invalidation:
    return "invalidation";
  case EventKind::InvalidationSuppressed:
    return "invalidation-suppressed";
  case EventKind::CallbackInvoked:
    return "callback-invoked";
  case EventKind::BatchStarted:
    return "batch-started";
  case EventKind::BatchCompleted:
    return "batch-completed";
  case EventKind::BasicRender:
    return "basic-render";
  case EventKind::SessionOpened:
    return "session-opened";
  case EventKind::SessionClosed:
    return "session-closed";
  case EventKind::Navigation:
    return "navigation";
  default:
    return "unknown";
  }
}

/**
 * @brief Parse the boundary string form of an event kind
 * @return std::nullopt for names outside the vocabulary
 */
inline std::optional<EventKind> EventKindFromString(const std::string &name) {
  for (EventKind kind : kAllEventKinds) {
    if (EventKindToString(kind) == name) {
      return kind;
    }
  }
  return std::nullopt;
}

/// Render-like events take part in trigger correlation
inline bool IsRenderKind(EventKind kind) {
  return kind == EventKind::Render || kind == EventKind::BasicRender;
}

inline std::string TriggerReasonToString(TriggerReason reason) {
  switch (reason) {
  case TriggerReason::Unknown:
    return "unknown";
  case TriggerReason::FirstRender:
    return "first-render";
  case TriggerReason::InvalidationCalled:
    return "invalidation-called";
  case TriggerReason::CallbackInvoked:
    return "callback-invoked";
  case TriggerReason::ParameterChanged:
    return "parameter-changed";
  case TriggerReason::ParentRerendered:
    return "parent-rerendered";
  default:
    return "unknown";
  }
}

} // namespace SHADE

#endif // SHADE_CORE_EVENT_KIND_HPP
