#ifndef SHADE_TIMELINE_ITIMELINE_RECORDER_HPP
#define SHADE_TIMELINE_ITIMELINE_RECORDER_HPP

#include <optional>
#include <string>
#include <vector>

#include "shade/timeline/TimelineTypes.hpp"

namespace SHADE {
namespace Timeline {

/**
 * @brief Process-wide recorder of causally-linked lifecycle events
 *
 * One explicitly constructed instance is shared by every session and
 * injected wherever events are produced or queried.
 *
 * State machine:
 *   Stopped -> Recording (StartRecording) -> Stopped (StopRecording)
 *
 * Nothing here throws on the recording path; calls made while stopped are
 * no-ops returning kNoEvent / kNoBatch.
 */
class ITimelineRecorder {
public:
  virtual ~ITimelineRecorder() = default;

  // === Recording controls ===

  /// Reset events, batches and sequence counters, then start recording
  virtual void StartRecording() = 0;

  /// Freeze the buffers without clearing them
  virtual void StopRecording() = 0;

  /// Drop events and batches; while recording also restarts the clock
  virtual void ClearEvents() = 0;

  virtual bool IsRecording() const = 0;

  // === Producers ===

  virtual EventId RecordEvent(ComponentId componentId,
                              const std::string &componentType, EventKind kind,
                              const EventOptions &options = {}) = 0;

  /// Open-duration variant; complete it with RecordEventEnd
  virtual EventId RecordEventStart(ComponentId componentId,
                                   const std::string &componentType,
                                   EventKind kind,
                                   const EventOptions &options = {}) = 0;

  /// Back-fill duration and end time; false if the id is gone or complete
  virtual bool RecordEventEnd(EventId eventId, double durationMs,
                              const std::optional<std::string> &details = std::nullopt) = 0;

  virtual BatchId RecordBatchStart(const std::string &triggerSource) = 0;

  virtual bool RecordBatchEnd(BatchId batchId,
                              const std::vector<ComponentId> &componentIds) = 0;

  // === Queries ===

  virtual std::vector<TimelineEvent> GetEvents() const = 0;
  virtual std::vector<TimelineEvent> GetEventsSince(EventId afterId) const = 0;

  /// Events with startMs <= timestamp <= endMs
  virtual std::vector<TimelineEvent> GetEventsInRange(double startMs,
                                                      double endMs) const = 0;
  virtual std::vector<TimelineEvent>
  GetEventsForComponent(ComponentId componentId) const = 0;
  virtual std::vector<RenderBatch> GetBatches() const = 0;
  virtual std::vector<RankedComponent> GetRankedComponents() const = 0;
  virtual RecorderState GetState() const = 0;

  /// Clamp n into the configured range, evict overflow, return the new cap
  virtual size_t SetMaxEvents(size_t n) = 0;
};

} // namespace Timeline
} // namespace SHADE

#endif // SHADE_TIMELINE_ITIMELINE_RECORDER_HPP
