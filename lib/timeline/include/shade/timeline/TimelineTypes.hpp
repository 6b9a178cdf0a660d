#ifndef SHADE_TIMELINE_TIMELINE_TYPES_HPP
#define SHADE_TIMELINE_TIMELINE_TYPES_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "shade/core/EventKind.hpp"
#include "shade/core/Identifiers.hpp"

namespace SHADE {
namespace Timeline {

/**
 * @brief One recorded timeline event
 *
 * Immutable once written, except that an open-duration event receives its
 * duration and end time exactly once.
 */
struct TimelineEvent {
  EventId event_id = kNoEvent;
  double timestamp_ms = 0.0;              ///< Relative to recording start
  std::optional<double> duration_ms;
  std::optional<double> end_time_ms;

  ComponentId component_id = kSessionComponentId;
  std::string component_type;
  EventKind kind = EventKind::Render;

  std::optional<EventId> parent_event_id;     ///< Enclosing batch-started event
  std::optional<EventId> triggering_event_id;
  TriggerReason trigger_reason = TriggerReason::Unknown;
  std::string trigger_details;

  bool is_async = false;
  bool is_first_render = false;
  bool was_suppressed = false;
  bool enhanced = true;

  std::optional<BatchId> batch_id;
  std::map<std::string, std::string> metadata;
};

/**
 * @brief Caller-provided attributes of a new event
 */
struct EventOptions {
  std::optional<double> duration_ms;
  bool is_async = false;
  bool is_first_render = false;
  bool suppressed = false;
  bool enhanced = true;
  std::string details;
  std::map<std::string, std::string> metadata;
};

/**
 * @brief A group of renders the host flushed together
 */
struct RenderBatch {
  BatchId batch_id = kNoBatch;
  double start_ms = 0.0;
  std::optional<double> end_ms;
  std::vector<ComponentId> component_ids;
  std::string trigger_source;
  EventId started_event_id = kNoEvent;

  std::optional<double> DurationMs() const {
    if (!end_ms) {
      return std::nullopt;
    }
    return *end_ms - start_ms;
  }
};

struct RecorderState {
  bool is_recording = false;
  std::optional<int64_t> started_at_ms; ///< Wall clock, ms since epoch
  double elapsed_ms = 0.0;
  size_t event_count = 0;
  size_t batch_count = 0;
  size_t max_events = 0;
  size_t max_batches = 0;
};

/**
 * @brief Render cost of one component aggregated over the buffer
 */
struct RankedComponent {
  ComponentId component_id = kSessionComponentId;
  std::string component_type;
  uint64_t render_count = 0;
  double total_ms = 0.0;
  double average_ms = 0.0;
  double max_ms = 0.0;
  double min_ms = 0.0;
};

} // namespace Timeline
} // namespace SHADE

#endif // SHADE_TIMELINE_TIMELINE_TYPES_HPP
