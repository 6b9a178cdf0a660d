#include "shade/timeline/TimelineRecorder.hpp"

#include <algorithm>
#include <map>
#include <utility>

#include "shade/util/Logger.hpp"

namespace SHADE {
namespace Timeline {

using Util::Logger;
using Util::Subsystem;

namespace {

const char *const kBatchSubject = "RenderBatch";

} // namespace

TimelineRecorder::TimelineRecorder(const TimelineConfig &config)
    : fConfig(config), fMaxEvents(ClampCap(config.max_events)),
      fMaxBatches(std::max<size_t>(1, config.max_batches)),
      fOrigin(Clock::now()) {
  if (fConfig.record_on_start) {
    StartRecording();
  }
}

// === Recording controls ===

void TimelineRecorder::StartRecording() {
  size_t maxEvents = 0;
  size_t maxBatches = 0;
  {
    std::lock_guard<std::mutex> lock(fMutex);
    if (fRecording) {
      return;
    }
    ResetLocked();
    fOrigin = Clock::now();
    fStartedAt = std::chrono::system_clock::now();
    fFrozenElapsedMs.reset();
    fRecording = true;
    maxEvents = fMaxEvents;
    maxBatches = fMaxBatches;
  }
  Logger::GetLogger(Subsystem::Timeline)
      ->Info("Recording started (max %zu events, %zu batches)", maxEvents,
             maxBatches);
}

void TimelineRecorder::StopRecording() {
  size_t retained = 0;
  {
    std::lock_guard<std::mutex> lock(fMutex);
    if (!fRecording) {
      return;
    }
    fFrozenElapsedMs = ElapsedMsLocked();
    fRecording = false;
    fOpenBatch.reset();
    retained = fEvents.size();
  }
  Logger::GetLogger(Subsystem::Timeline)
      ->Info("Recording stopped with %zu events retained", retained);
}

void TimelineRecorder::ClearEvents() {
  std::lock_guard<std::mutex> lock(fMutex);
  ResetLocked();
  if (fRecording) {
    fOrigin = Clock::now();
    fStartedAt = std::chrono::system_clock::now();
  }
}

bool TimelineRecorder::IsRecording() const {
  std::lock_guard<std::mutex> lock(fMutex);
  return fRecording;
}

void TimelineRecorder::ResetLocked() {
  fEvents.clear();
  fBatches.clear();
  fCorrelation.clear();
  fOpenBatch.reset();
  fNextEventId = 0;
  fNextBatchId = 0;
}

double TimelineRecorder::ElapsedMsLocked() const {
  if (!fRecording) {
    return fFrozenElapsedMs.value_or(0.0);
  }
  return std::chrono::duration<double, std::milli>(Clock::now() - fOrigin)
      .count();
}

size_t TimelineRecorder::ClampCap(size_t n) const {
  size_t hi = std::max<size_t>(1, fConfig.max_event_cap);
  size_t lo = std::min<size_t>(std::max<size_t>(1, fConfig.min_event_cap), hi);
  return std::clamp(n, lo, hi);
}

// === Producers ===

EventId TimelineRecorder::RecordEvent(ComponentId componentId,
                                      const std::string &componentType,
                                      EventKind kind,
                                      const EventOptions &options) {
  std::lock_guard<std::mutex> lock(fMutex);
  if (!fRecording) {
    return kNoEvent;
  }
  std::optional<BatchId> batchId;
  std::optional<EventId> parentId;
  if (fOpenBatch) {
    batchId = fOpenBatch->batch_id;
    parentId = fOpenBatch->started_event_id;
  }
  return AppendLocked(componentId, componentType, kind, options, batchId,
                      parentId);
}

EventId TimelineRecorder::RecordEventStart(ComponentId componentId,
                                           const std::string &componentType,
                                           EventKind kind,
                                           const EventOptions &options) {
  EventOptions open = options;
  open.duration_ms.reset();
  return RecordEvent(componentId, componentType, kind, open);
}

bool TimelineRecorder::RecordEventEnd(EventId eventId, double durationMs,
                                      const std::optional<std::string> &details) {
  std::lock_guard<std::mutex> lock(fMutex);
  if (!fRecording) {
    return false;
  }
  TimelineEvent *event = FindEventLocked(eventId);
  if (!event || event->duration_ms) {
    return false;
  }
  event->duration_ms = durationMs;
  event->end_time_ms = event->timestamp_ms + durationMs;
  if (details) {
    if (event->trigger_details.empty()) {
      event->trigger_details = *details;
    } else {
      event->trigger_details += "; " + *details;
    }
  }
  return true;
}

BatchId TimelineRecorder::RecordBatchStart(const std::string &triggerSource) {
  std::lock_guard<std::mutex> lock(fMutex);
  if (!fRecording) {
    return kNoBatch;
  }
  if (fOpenBatch) {
    Logger::GetLogger(Subsystem::Timeline)
        ->Debug("Batch %lld left open by a new batch",
                static_cast<long long>(fOpenBatch->batch_id));
    fOpenBatch.reset();
  }

  BatchId batchId = fNextBatchId++;
  EventOptions options;
  options.details = triggerSource;
  EventId started = AppendLocked(kSessionComponentId, kBatchSubject,
                                 EventKind::BatchStarted, options, batchId,
                                 std::nullopt);

  RenderBatch batch;
  batch.batch_id = batchId;
  batch.start_ms = fEvents.back().timestamp_ms;
  batch.trigger_source = triggerSource;
  batch.started_event_id = started;
  fBatches.push_back(std::move(batch));
  fOpenBatch = OpenBatch{batchId, started};
  EvictLocked();
  return batchId;
}

bool TimelineRecorder::RecordBatchEnd(BatchId batchId,
                                      const std::vector<ComponentId> &componentIds) {
  std::lock_guard<std::mutex> lock(fMutex);
  if (!fRecording) {
    return false;
  }
  auto it = std::find_if(fBatches.rbegin(), fBatches.rend(),
                         [batchId](const RenderBatch &b) {
                           return b.batch_id == batchId;
                         });
  if (it == fBatches.rend() || it->end_ms) {
    return false;
  }
  if (fOpenBatch && fOpenBatch->batch_id == batchId) {
    fOpenBatch.reset();
  }

  RenderBatch &batch = *it;
  EventOptions options;
  options.details = batch.trigger_source;
  options.duration_ms = ElapsedMsLocked() - batch.start_ms;
  AppendLocked(kSessionComponentId, kBatchSubject, EventKind::BatchCompleted,
               options, batchId, batch.started_event_id);

  batch.end_ms = fEvents.back().timestamp_ms;
  batch.component_ids = componentIds;
  return true;
}

EventId TimelineRecorder::AppendLocked(ComponentId componentId,
                                       const std::string &componentType,
                                       EventKind kind,
                                       const EventOptions &options,
                                       std::optional<BatchId> batchId,
                                       std::optional<EventId> parentEventId) {
  TimelineEvent event;
  event.event_id = fNextEventId++;
  event.timestamp_ms = ElapsedMsLocked();
  if (options.duration_ms) {
    event.duration_ms = options.duration_ms;
    event.end_time_ms = event.timestamp_ms + *options.duration_ms;
  }
  event.component_id = componentId;
  event.component_type = componentType;
  event.kind = kind;
  event.parent_event_id = parentEventId;
  event.trigger_details = options.details;
  event.is_async = options.is_async;
  event.is_first_render = options.is_first_render;
  event.was_suppressed = options.suppressed;
  event.enhanced = options.enhanced;
  event.batch_id = batchId;
  event.metadata = options.metadata;

  CorrelateLocked(event);
  fEvents.push_back(std::move(event));
  UpdateIndicesLocked(fEvents.back());
  EventId id = fEvents.back().event_id;
  EvictLocked();
  return id;
}

void TimelineRecorder::CorrelateLocked(TimelineEvent &event) {
  if (!IsRenderKind(event.kind)) {
    event.trigger_reason = TriggerReason::Unknown;
    return;
  }
  if (event.is_first_render) {
    event.trigger_reason = TriggerReason::FirstRender;
    return;
  }
  // Unresolved components share the session id; their causes are unknown
  if (event.component_id == kSessionComponentId) {
    event.trigger_reason = TriggerReason::Unknown;
    return;
  }

  auto it = fCorrelation.find(event.component_id);
  if (it != fCorrelation.end()) {
    const auto &index = it->second;
    if (index.last_invalidation) {
      event.triggering_event_id = index.last_invalidation;
      event.trigger_reason = TriggerReason::InvalidationCalled;
      return;
    }
    if (index.last_callback) {
      event.triggering_event_id = index.last_callback;
      event.trigger_reason = TriggerReason::CallbackInvoked;
      return;
    }
    if (index.last_parameter_set) {
      event.triggering_event_id = index.last_parameter_set;
      event.trigger_reason = TriggerReason::ParameterChanged;
      return;
    }
  }
  event.trigger_reason = TriggerReason::ParentRerendered;
}

void TimelineRecorder::UpdateIndicesLocked(const TimelineEvent &event) {
  if (event.component_id == kSessionComponentId) {
    return;
  }
  switch (event.kind) {
  case EventKind::Invalidation:
    fCorrelation[event.component_id].last_invalidation = event.event_id;
    break;
  case EventKind::CallbackInvoked:
    fCorrelation[event.component_id].last_callback = event.event_id;
    break;
  case EventKind::ParameterSet:
    fCorrelation[event.component_id].last_parameter_set = event.event_id;
    break;
  case EventKind::Render:
  case EventKind::BasicRender:
  case EventKind::Dispose:
    fCorrelation.erase(event.component_id);
    break;
  default:
    break;
  }
}

void TimelineRecorder::EvictLocked() {
  while (fEvents.size() > fMaxEvents) {
    fEvents.pop_front();
  }
  while (fBatches.size() > fMaxBatches) {
    fBatches.pop_front();
  }
  if (fOpenBatch &&
      (fBatches.empty() || fBatches.front().batch_id > fOpenBatch->batch_id)) {
    fOpenBatch.reset();
  }
}

TimelineEvent *TimelineRecorder::FindEventLocked(EventId eventId) {
  if (fEvents.empty()) {
    return nullptr;
  }
  EventId first = fEvents.front().event_id;
  if (eventId < first || eventId > fEvents.back().event_id) {
    return nullptr;
  }
  return &fEvents[static_cast<size_t>(eventId - first)];
}

// === Queries ===

std::vector<TimelineEvent> TimelineRecorder::GetEvents() const {
  std::lock_guard<std::mutex> lock(fMutex);
  return std::vector<TimelineEvent>(fEvents.begin(), fEvents.end());
}

std::vector<TimelineEvent> TimelineRecorder::GetEventsSince(EventId afterId) const {
  std::lock_guard<std::mutex> lock(fMutex);
  std::vector<TimelineEvent> result;
  for (const auto &event : fEvents) {
    if (event.event_id > afterId) {
      result.push_back(event);
    }
  }
  return result;
}

std::vector<TimelineEvent> TimelineRecorder::GetEventsInRange(double startMs,
                                                              double endMs) const {
  std::lock_guard<std::mutex> lock(fMutex);
  std::vector<TimelineEvent> result;
  for (const auto &event : fEvents) {
    if (event.timestamp_ms >= startMs && event.timestamp_ms <= endMs) {
      result.push_back(event);
    }
  }
  return result;
}

std::vector<TimelineEvent>
TimelineRecorder::GetEventsForComponent(ComponentId componentId) const {
  std::lock_guard<std::mutex> lock(fMutex);
  std::vector<TimelineEvent> result;
  for (const auto &event : fEvents) {
    if (event.component_id == componentId) {
      result.push_back(event);
    }
  }
  return result;
}

std::vector<RenderBatch> TimelineRecorder::GetBatches() const {
  std::lock_guard<std::mutex> lock(fMutex);
  return std::vector<RenderBatch>(fBatches.begin(), fBatches.end());
}

std::vector<RankedComponent> TimelineRecorder::GetRankedComponents() const {
  std::map<std::pair<ComponentId, std::string>, RankedComponent> groups;
  {
    std::lock_guard<std::mutex> lock(fMutex);
    for (const auto &event : fEvents) {
      if (!IsRenderKind(event.kind) || !event.duration_ms) {
        continue;
      }
      auto &entry = groups[{event.component_id, event.component_type}];
      entry.component_id = event.component_id;
      entry.component_type = event.component_type;
      entry.min_ms = entry.render_count == 0
                         ? *event.duration_ms
                         : std::min(entry.min_ms, *event.duration_ms);
      entry.render_count++;
      entry.total_ms += *event.duration_ms;
      entry.max_ms = std::max(entry.max_ms, *event.duration_ms);
    }
  }

  std::vector<RankedComponent> ranked;
  ranked.reserve(groups.size());
  for (auto &kv : groups) {
    kv.second.average_ms =
        kv.second.total_ms / static_cast<double>(kv.second.render_count);
    ranked.push_back(std::move(kv.second));
  }
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const RankedComponent &a, const RankedComponent &b) {
                     if (a.total_ms != b.total_ms) {
                       return a.total_ms > b.total_ms;
                     }
                     return a.component_id < b.component_id;
                   });
  return ranked;
}

RecorderState TimelineRecorder::GetState() const {
  std::lock_guard<std::mutex> lock(fMutex);
  RecorderState state;
  state.is_recording = fRecording;
  if (fStartedAt) {
    state.started_at_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              fStartedAt->time_since_epoch())
                              .count();
  }
  state.elapsed_ms = ElapsedMsLocked();
  state.event_count = fEvents.size();
  state.batch_count = fBatches.size();
  state.max_events = fMaxEvents;
  state.max_batches = fMaxBatches;
  return state;
}

size_t TimelineRecorder::SetMaxEvents(size_t n) {
  std::lock_guard<std::mutex> lock(fMutex);
  fMaxEvents = ClampCap(n);
  if (fMaxEvents != n) {
    Logger::GetLogger(Subsystem::Timeline)
        ->Debug("Requested event cap %zu clamped to %zu", n, fMaxEvents);
  }
  EvictLocked();
  return fMaxEvents;
}

} // namespace Timeline
} // namespace SHADE
