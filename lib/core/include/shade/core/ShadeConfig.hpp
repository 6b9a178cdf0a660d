#ifndef SHADE_CORE_SHADE_CONFIG_HPP
#define SHADE_CORE_SHADE_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "shade/core/EventKind.hpp"
#include "shade/util/Logger.hpp"

namespace SHADE {

/**
 * @brief Bounds of the timeline ring buffers
 *
 * max_events is clamped into [min_event_cap, max_event_cap] when a recorder
 * is constructed and on every SetMaxEvents call.
 */
struct TimelineConfig {
  uint32_t max_events = 5000;     ///< Event ring buffer capacity
  uint32_t max_batches = 500;     ///< Batch ring buffer capacity
  uint32_t min_event_cap = 100;   ///< Lower clamp for max_events
  uint32_t max_event_cap = 50000; ///< Upper clamp for max_events
  bool record_on_start = false;   ///< Start recording when constructed
};

/**
 * @brief Filters applied by the instrumentation hooks
 */
struct InstrumentationConfig {
  bool timing_enabled = true;            ///< Record phase durations at all
  double min_duration_to_record_ms = 0.0; ///< Drop timed events shorter than this
  std::vector<std::string> excluded_component_types; ///< Short or full type names
  std::vector<EventKind> event_kind_filter; ///< Empty: record every kind
};

/**
 * @brief Inspector endpoint settings
 */
struct InspectorConfig {
  bool enabled = false;
  std::string endpoint = "tcp://127.0.0.1:5590"; ///< REP socket bind address
  uint32_t receive_timeout_ms = 200;             ///< Listener poll interval
  uint32_t max_consecutive_failures = 5;         ///< Listener gives up after this
};

struct LoggingConfig {
  Util::LogLevel level = Util::LogLevel::INFO;
  std::string directory; ///< Empty: log to the console only
};

/**
 * @brief Top-level engine configuration
 *
 * Example JSON:
 *   {
 *     "reconcile_interval_ms": 1000,
 *     "timeline": { "max_events": 5000, "max_batches": 500,
 *                   "record_on_start": false },
 *     "instrumentation": {
 *       "timing_enabled": true,
 *       "min_duration_to_record_ms": 0.0,
 *       "excluded_component_types": ["CascadingValue"],
 *       "event_kind_filter": ["render", "invalidation"]
 *     },
 *     "inspector": { "enabled": true, "endpoint": "tcp://127.0.0.1:5590",
 *                    "receive_timeout_ms": 200,
 *                    "max_consecutive_failures": 5 },
 *     "logging": { "level": "INFO", "directory": "" }
 *   }
 */
struct ShadeConfig {
  uint32_t reconcile_interval_ms = 1000; ///< Minimum gap between passes (0 = none)

  TimelineConfig timeline;
  InstrumentationConfig instrumentation;
  InspectorConfig inspector;
  LoggingConfig logging;
};

} // namespace SHADE

#endif // SHADE_CORE_SHADE_CONFIG_HPP
