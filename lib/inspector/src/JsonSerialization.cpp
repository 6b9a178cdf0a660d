#include "shade/inspector/JsonSerialization.hpp"

#include "shade/core/ComponentMode.hpp"
#include "shade/core/EventKind.hpp"
#include "shade/core/LifecyclePhase.hpp"

namespace SHADE {
namespace Inspector {

namespace {

template <typename T> nlohmann::json Nullable(const std::optional<T> &value) {
  if (!value) {
    return nullptr;
  }
  return *value;
}

} // namespace

nlohmann::json ToJson(const Timeline::TimelineEvent &event) {
  return {{"event_id", event.event_id},
          {"timestamp_ms", event.timestamp_ms},
          {"duration_ms", Nullable(event.duration_ms)},
          {"end_time_ms", Nullable(event.end_time_ms)},
          {"component_id", event.component_id},
          {"component_type", event.component_type},
          {"kind", EventKindToString(event.kind)},
          {"parent_event_id", Nullable(event.parent_event_id)},
          {"triggering_event_id", Nullable(event.triggering_event_id)},
          {"trigger_reason", TriggerReasonToString(event.trigger_reason)},
          {"trigger_details", event.trigger_details},
          {"is_async", event.is_async},
          {"is_first_render", event.is_first_render},
          {"was_suppressed", event.was_suppressed},
          {"enhanced", event.enhanced},
          {"batch_id", Nullable(event.batch_id)},
          {"metadata", event.metadata}};
}

nlohmann::json ToJson(const Timeline::RenderBatch &batch) {
  return {{"batch_id", batch.batch_id},
          {"start_ms", batch.start_ms},
          {"end_ms", Nullable(batch.end_ms)},
          {"duration_ms", Nullable(batch.DurationMs())},
          {"component_ids", batch.component_ids},
          {"trigger_source", batch.trigger_source},
          {"started_event_id", batch.started_event_id}};
}

nlohmann::json ToJson(const Timeline::RecorderState &state) {
  return {{"is_recording", state.is_recording},
          {"started_at_ms", Nullable(state.started_at_ms)},
          {"elapsed_ms", state.elapsed_ms},
          {"event_count", state.event_count},
          {"batch_count", state.batch_count},
          {"max_events", state.max_events},
          {"max_batches", state.max_batches}};
}

nlohmann::json ToJson(const Timeline::RankedComponent &ranked) {
  return {{"component_id", ranked.component_id},
          {"component_type", ranked.component_type},
          {"render_count", ranked.render_count},
          {"total_ms", ranked.total_ms},
          {"average_ms", ranked.average_ms},
          {"max_ms", ranked.max_ms},
          {"min_ms", ranked.min_ms}};
}

nlohmann::json ToJson(const Tracking::ComponentCounts &counts) {
  return {{"resolved", counts.resolved},
          {"pending", counts.pending},
          {"total", counts.total}};
}

nlohmann::json ToJson(const Tracking::LifecycleMetrics &metrics,
                      Tracking::LifecycleMetrics::Clock::time_point now) {
  nlohmann::json phases = nlohmann::json::object();
  for (size_t i = 0; i < kLifecyclePhaseCount; ++i) {
    auto phase = static_cast<LifecyclePhase>(i);
    phases[LifecyclePhaseToString(phase)] = {
        {"calls", metrics.GetCallCount(phase)},
        {"last_ms", Nullable(metrics.GetLastDuration(phase))},
        {"total_ms", metrics.GetTotalDuration(phase)},
        {"average_ms", Nullable(metrics.GetAverageDuration(phase))},
        {"last_async_ms", Nullable(metrics.GetLastAsyncDuration(phase))},
        {"async_total_ms", metrics.GetAsyncTotalDuration(phase)}};
  }

  return {{"phases", phases},
          {"render_count", metrics.GetRenderCount()},
          {"max_render_ms", Nullable(metrics.GetMaxRenderDuration())},
          {"min_render_ms", Nullable(metrics.GetMinRenderDuration())},
          {"max_event_callback_ms", Nullable(metrics.GetMaxEventCallbackDuration())},
          {"invalidation_calls", metrics.GetInvalidationCalls()},
          {"invalidations_honored", metrics.GetHonoredInvalidations()},
          {"suppressed_already_queued", metrics.GetSuppressedAlreadyQueued()},
          {"suppressed_by_policy", metrics.GetSuppressedByPolicy()},
          {"gate_allowed", metrics.GetGateAllowed()},
          {"gate_declined", metrics.GetGateDeclined()},
          {"last_gate_decision", Nullable(metrics.GetLastGateDecision())},
          {"disposed", metrics.IsDisposed()},
          {"lifetime_ms", metrics.GetLifetimeMs(now)},
          {"time_to_first_render_ms", Nullable(metrics.GetTimeToFirstRenderMs())},
          {"invalidation_efficiency", Nullable(metrics.GetInvalidationEfficiency())},
          {"suppression_ratio", Nullable(metrics.GetSuppressionRatio())},
          {"gate_block_rate", Nullable(metrics.GetGateBlockRate())},
          {"total_sync_lifecycle_ms", metrics.GetTotalSyncLifecycleMs()},
          {"renders_per_minute", Nullable(metrics.GetRendersPerMinute(now))}};
}

nlohmann::json ToJson(const Tracking::ParameterValue &parameter) {
  return {{"name", parameter.name},
          {"type_name", parameter.type_name},
          {"value", Nullable(parameter.value)},
          {"is_cascading", parameter.is_cascading}};
}

nlohmann::json ToJson(const Tracking::InternalStateFlags &flags) {
  return {{"has_never_rendered", flags.has_never_rendered},
          {"has_pending_queued_render", flags.has_pending_queued_render},
          {"has_called_post_render", flags.has_called_post_render},
          {"is_initialized", flags.is_initialized}};
}

nlohmann::json ToJson(const Tracking::ComponentSummary &summary) {
  nlohmann::json json = {
      {"id", summary.id},
      {"type_name", summary.type.name},
      {"full_type_name", summary.type.full_name},
      {"parent_id", Nullable(summary.parent_id)},
      {"state", LifecycleStateToString(summary.state)},
      {"mode", ComponentModeToString(summary.mode)},
      {"created_at_ms", summary.created_at_ms},
      {"instance_alive", summary.instance_alive},
      {"basic_render_count", summary.basic_render_count},
      {"last_basic_render_ms", Nullable(summary.last_basic_render_ms)}};

  const auto &details = summary.details;
  json["source_file"] = nullptr;
  json["line_number"] = nullptr;
  if (details.source) {
    json["source_file"] = details.source->file;
    json["line_number"] = details.source->line;
  }
  // Absent collections are null rather than empty
  json["parameters"] =
      details.parameters.empty() ? nlohmann::json() : ToJsonArray(details.parameters);
  if (details.tracked_state.empty()) {
    json["tracked_state"] = nullptr;
  } else {
    nlohmann::json state = nlohmann::json::object();
    for (const auto &kv : details.tracked_state) {
      state[kv.first] = Nullable(kv.second);
    }
    json["tracked_state"] = state;
  }
  json["internal_state"] = details.internal_state
                               ? ToJson(*details.internal_state)
                               : nlohmann::json();

  if (summary.metrics) {
    json["metrics"] =
        ToJson(*summary.metrics, Tracking::LifecycleMetrics::Clock::now());
  } else {
    json["metrics"] = nullptr;
  }
  return json;
}

} // namespace Inspector
} // namespace SHADE
