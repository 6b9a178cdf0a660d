#ifndef SHADE_TIMELINE_TIMELINE_RECORDER_HPP
#define SHADE_TIMELINE_TIMELINE_RECORDER_HPP

#include <chrono>
#include <deque>
#include <mutex>
#include <unordered_map>

#include "shade/core/ShadeConfig.hpp"
#include "shade/timeline/ITimelineRecorder.hpp"

namespace SHADE {
namespace Timeline {

/**
 * @brief Bounded ring-buffer implementation of ITimelineRecorder
 *
 * Events and batches live in two deques evicted from the front once their
 * cap is exceeded. Sequence ids are gapless among recorded events, so an
 * event is located by its offset from the oldest retained id.
 *
 * Render events are attributed to a trigger by looking, in order, at the
 * component's last invalidation, callback and parameter-set events. Each
 * render consumes all three.
 */
class TimelineRecorder : public ITimelineRecorder {
public:
  explicit TimelineRecorder(const TimelineConfig &config = TimelineConfig());
  ~TimelineRecorder() override = default;

  TimelineRecorder(const TimelineRecorder &) = delete;
  TimelineRecorder &operator=(const TimelineRecorder &) = delete;

  void StartRecording() override;
  void StopRecording() override;
  void ClearEvents() override;
  bool IsRecording() const override;

  EventId RecordEvent(ComponentId componentId, const std::string &componentType,
                      EventKind kind, const EventOptions &options = {}) override;
  EventId RecordEventStart(ComponentId componentId,
                           const std::string &componentType, EventKind kind,
                           const EventOptions &options = {}) override;
  bool RecordEventEnd(EventId eventId, double durationMs,
                      const std::optional<std::string> &details = std::nullopt) override;

  BatchId RecordBatchStart(const std::string &triggerSource) override;
  bool RecordBatchEnd(BatchId batchId,
                      const std::vector<ComponentId> &componentIds) override;

  std::vector<TimelineEvent> GetEvents() const override;
  std::vector<TimelineEvent> GetEventsSince(EventId afterId) const override;
  std::vector<TimelineEvent> GetEventsInRange(double startMs,
                                              double endMs) const override;
  std::vector<TimelineEvent>
  GetEventsForComponent(ComponentId componentId) const override;
  std::vector<RenderBatch> GetBatches() const override;
  std::vector<RankedComponent> GetRankedComponents() const override;
  RecorderState GetState() const override;

  size_t SetMaxEvents(size_t n) override;

private:
  using Clock = std::chrono::steady_clock;

  struct CorrelationIndex {
    std::optional<EventId> last_invalidation;
    std::optional<EventId> last_callback;
    std::optional<EventId> last_parameter_set;
  };

  struct OpenBatch {
    BatchId batch_id;
    EventId started_event_id;
  };

  EventId AppendLocked(ComponentId componentId, const std::string &componentType,
                       EventKind kind, const EventOptions &options,
                       std::optional<BatchId> batchId,
                       std::optional<EventId> parentEventId);
  void CorrelateLocked(TimelineEvent &event);
  void UpdateIndicesLocked(const TimelineEvent &event);
  void EvictLocked();
  void ResetLocked();
  double ElapsedMsLocked() const;
  TimelineEvent *FindEventLocked(EventId eventId);
  size_t ClampCap(size_t n) const;

  const TimelineConfig fConfig;

  mutable std::mutex fMutex;
  bool fRecording = false;
  size_t fMaxEvents;
  size_t fMaxBatches;

  std::deque<TimelineEvent> fEvents;
  std::deque<RenderBatch> fBatches;
  std::unordered_map<ComponentId, CorrelationIndex> fCorrelation;
  std::optional<OpenBatch> fOpenBatch;

  EventId fNextEventId = 0;
  BatchId fNextBatchId = 0;

  Clock::time_point fOrigin;
  std::optional<std::chrono::system_clock::time_point> fStartedAt;
  std::optional<double> fFrozenElapsedMs;
};

} // namespace Timeline
} // namespace SHADE

#endif // SHADE_TIMELINE_TIMELINE_RECORDER_HPP
