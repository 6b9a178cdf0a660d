#include "shade/runtime/InstrumentationHooks.hpp"

#include <algorithm>

#include "shade/tracking/LifecycleMetrics.hpp"
#include "shade/util/Logger.hpp"

namespace SHADE {
namespace Runtime {

using Tracking::LifecycleMetrics;
using Util::Logger;
using Util::Subsystem;

InstrumentationHooks::InstrumentationHooks(std::shared_ptr<Session> session,
                                           InstrumentationConfig config)
    : fSession(std::move(session)), fConfig(std::move(config)) {}

template <typename Fn>
void InstrumentationHooks::Guard(const char *hook, Fn &&fn) {
  if (!fSession) {
    return;
  }
  try {
    fn();
  } catch (const std::exception &e) {
    fSwallowed++;
    Logger::GetLogger(Subsystem::Runtime)
        ->Warning("Hook %s failed in session '%s': %s", hook,
                  fSession->GetId().c_str(), e.what());
  }
}

bool InstrumentationHooks::IsExcluded(const ComponentTypeInfo &type) const {
  const auto &excluded = fConfig.excluded_component_types;
  return std::any_of(excluded.begin(), excluded.end(),
                     [&type](const std::string &name) {
                       return name == type.name || name == type.full_name;
                     });
}

bool InstrumentationHooks::IsKindEnabled(EventKind kind) const {
  const auto &filter = fConfig.event_kind_filter;
  return filter.empty() ||
         std::find(filter.begin(), filter.end(), kind) != filter.end();
}

double InstrumentationHooks::Timed(double durationMs) const {
  return fConfig.timing_enabled ? durationMs : 0.0;
}

void InstrumentationHooks::Emit(ComponentId id, const std::string &typeName,
                                EventKind kind, Timeline::EventOptions options) {
  if (!IsKindEnabled(kind)) {
    return;
  }
  if (!fConfig.timing_enabled) {
    options.duration_ms.reset();
  } else if (options.duration_ms &&
             *options.duration_ms < fConfig.min_duration_to_record_ms) {
    return;
  }
  fSession->GetRecorder().RecordEvent(id, typeName, kind, options);
}

// === Identity ===

void InstrumentationHooks::OnCreate(const std::shared_ptr<void> &instance,
                                    const ComponentTypeInfo &type,
                                    ComponentMode mode) {
  Guard("OnCreate", [&] {
    if (IsExcluded(type)) {
      return;
    }
    fSession->GetRegistry().RegisterPending(instance, type, mode);
  });
}

void InstrumentationHooks::OnAttach(const std::shared_ptr<void> &instance,
                                    ComponentId id) {
  Guard("OnAttach",
        [&] { fSession->GetRegistry().ResolveDirect(instance, id); });
}

void InstrumentationHooks::OnDispose(const std::shared_ptr<void> &instance) {
  Guard("OnDispose", [&] {
    auto &registry = fSession->GetRegistry();
    auto info = registry.DescribeInstance(instance);
    if (!info) {
      return;
    }

    std::optional<double> lifetimeMs;
    registry.UpdateMetrics(instance, [&](LifecycleMetrics &metrics) {
      auto now = LifecycleMetrics::Clock::now();
      metrics.MarkDisposed(now);
      lifetimeMs = metrics.GetLifetimeMs(now);
    });

    Timeline::EventOptions options;
    options.enhanced = info->mode == ComponentMode::Enhanced;
    if (lifetimeMs) {
      options.metadata["lifetime_ms"] = std::to_string(*lifetimeMs);
    }
    Emit(info->id, info->type.name, EventKind::Dispose, options);
    registry.Unregister(instance);
  });
}

// === Timed lifecycle phases ===

void InstrumentationHooks::TimedPhase(const char *hook,
                                      const std::shared_ptr<void> &instance,
                                      LifecyclePhase phase, EventKind kind,
                                      double durationMs, bool isAsync,
                                      bool firstRender) {
  Guard(hook, [&] {
    auto &registry = fSession->GetRegistry();
    auto info = registry.DescribeInstance(instance);
    if (!info) {
      return;
    }

    double measured = Timed(durationMs);
    registry.UpdateMetrics(instance, [&](LifecycleMetrics &metrics) {
      if (isAsync) {
        metrics.RecordAsyncPhase(phase, measured);
      } else {
        metrics.RecordPhase(phase, measured);
      }
    });

    Timeline::EventOptions options;
    options.duration_ms = durationMs;
    options.is_async = isAsync;
    options.is_first_render = firstRender;
    options.enhanced = info->mode == ComponentMode::Enhanced;
    Emit(info->id, info->type.name, kind, options);
  });
}

void InstrumentationHooks::OnInitialized(const std::shared_ptr<void> &instance,
                                         double durationMs, bool isAsync) {
  TimedPhase("OnInitialized", instance, LifecyclePhase::Initialize,
             EventKind::Initialize, durationMs, isAsync, false);
}

void InstrumentationHooks::OnParametersSet(const std::shared_ptr<void> &instance,
                                           double durationMs, bool isAsync) {
  TimedPhase("OnParametersSet", instance, LifecyclePhase::ParameterSet,
             EventKind::ParameterSet, durationMs, isAsync, false);
  Guard("OnParametersSet",
        [&] { fSession->GetRegistry().RefreshDetails(instance); });
}

void InstrumentationHooks::OnRender(const std::shared_ptr<void> &instance,
                                    double durationMs, bool firstRender) {
  TimedPhase("OnRender", instance, LifecyclePhase::Render, EventKind::Render,
             durationMs, false, firstRender);
}

void InstrumentationHooks::OnPostRender(const std::shared_ptr<void> &instance,
                                        double durationMs, bool firstRender,
                                        bool isAsync) {
  TimedPhase("OnPostRender", instance, LifecyclePhase::PostRender,
             EventKind::PostRender, durationMs, isAsync, firstRender);
}

void InstrumentationHooks::OnCallbackInvoked(const std::shared_ptr<void> &instance,
                                             double durationMs,
                                             const std::string &callbackName) {
  Guard("OnCallbackInvoked", [&] {
    auto &registry = fSession->GetRegistry();
    auto info = registry.DescribeInstance(instance);
    if (!info) {
      return;
    }
    double measured = Timed(durationMs);
    registry.UpdateMetrics(instance, [&](LifecycleMetrics &metrics) {
      metrics.RecordPhase(LifecyclePhase::EventCallback, measured);
    });

    Timeline::EventOptions options;
    options.duration_ms = durationMs;
    options.details = callbackName;
    options.enhanced = info->mode == ComponentMode::Enhanced;
    Emit(info->id, info->type.name, EventKind::CallbackInvoked, options);
  });
}

// === Render requests ===

InvalidationOutcome
InstrumentationHooks::OnInvalidate(const std::shared_ptr<void> &instance,
                                   bool renderAlreadyQueued, bool gateDeclined) {
  InvalidationOutcome outcome =
      LifecycleMetrics::ClassifyInvalidation(renderAlreadyQueued, gateDeclined);

  Guard("OnInvalidate", [&] {
    auto &registry = fSession->GetRegistry();
    auto info = registry.DescribeInstance(instance);
    if (!info) {
      return;
    }
    registry.UpdateMetrics(instance, [&](LifecycleMetrics &metrics) {
      outcome = metrics.RecordInvalidation(renderAlreadyQueued, gateDeclined);
    });

    Timeline::EventOptions options;
    options.enhanced = info->mode == ComponentMode::Enhanced;
    if (outcome == InvalidationOutcome::Honored) {
      Emit(info->id, info->type.name, EventKind::Invalidation, options);
    } else {
      options.suppressed = true;
      options.details = InvalidationOutcomeToString(outcome);
      Emit(info->id, info->type.name, EventKind::InvalidationSuppressed, options);
    }
  });
  return outcome;
}

void InstrumentationHooks::OnGateDecision(const std::shared_ptr<void> &instance,
                                          bool allowed) {
  Guard("OnGateDecision", [&] {
    fSession->GetRegistry().UpdateMetrics(
        instance,
        [allowed](LifecycleMetrics &metrics) { metrics.RecordGateDecision(allowed); });
  });
}

// === Host-level observations ===

void InstrumentationHooks::OnBasicRender(ComponentId id,
                                         const std::string &typeName,
                                         std::optional<double> durationMs,
                                         bool firstRender) {
  Guard("OnBasicRender", [&] {
    if (IsExcluded(ComponentTypeInfo::FromFullName(typeName))) {
      return;
    }
    fSession->GetRegistry().RecordBasicRender(id);

    Timeline::EventOptions options;
    options.duration_ms = durationMs;
    options.is_first_render = firstRender;
    options.enhanced = false;
    Emit(id, typeName, EventKind::BasicRender, options);
  });
}

BatchId InstrumentationHooks::OnBatchStarted(const std::string &triggerSource) {
  BatchId batchId = kNoBatch;
  Guard("OnBatchStarted", [&] {
    batchId = fSession->GetRecorder().RecordBatchStart(triggerSource);
  });
  return batchId;
}

void InstrumentationHooks::OnBatchCompleted(
    BatchId batchId, const std::vector<ComponentId> &componentIds) {
  Guard("OnBatchCompleted", [&] {
    fSession->GetRecorder().RecordBatchEnd(batchId, componentIds);
  });
}

void InstrumentationHooks::OnNavigation(const std::string &location) {
  Guard("OnNavigation", [&] {
    Timeline::EventOptions options;
    options.details = location;
    options.metadata["session"] = fSession->GetId();
    Emit(kSessionComponentId, "Navigation", EventKind::Navigation, options);
  });
}

} // namespace Runtime
} // namespace SHADE
