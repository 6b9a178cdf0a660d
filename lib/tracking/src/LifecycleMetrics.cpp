#include "shade/tracking/LifecycleMetrics.hpp"

#include <algorithm>

namespace SHADE {
namespace Tracking {

namespace {

double MillisecondsBetween(LifecycleMetrics::Clock::time_point from,
                           LifecycleMetrics::Clock::time_point to) {
  return std::chrono::duration<double, std::milli>(to - from).count();
}

std::optional<double> Ratio(uint64_t numerator, uint64_t denominator) {
  if (denominator == 0) {
    return std::nullopt;
  }
  return static_cast<double>(numerator) / static_cast<double>(denominator);
}

} // namespace

LifecycleMetrics::LifecycleMetrics(Clock::time_point createdAt)
    : fCreatedAt(createdAt) {}

void LifecycleMetrics::RecordPhase(LifecyclePhase phase, double durationMs,
                                   Clock::time_point at) {
  auto &stats = Stats(phase);
  stats.calls++;
  stats.last_ms = durationMs;
  stats.total_ms += durationMs;

  if (phase == LifecyclePhase::Render) {
    fMaxRenderMs = fMaxRenderMs ? std::max(*fMaxRenderMs, durationMs) : durationMs;
    fMinRenderMs = fMinRenderMs ? std::min(*fMinRenderMs, durationMs) : durationMs;
    if (!fTimeToFirstRenderMs) {
      fTimeToFirstRenderMs = MillisecondsBetween(fCreatedAt, at);
    }
  } else if (phase == LifecyclePhase::EventCallback) {
    fMaxCallbackMs =
        fMaxCallbackMs ? std::max(*fMaxCallbackMs, durationMs) : durationMs;
  }
}

void LifecycleMetrics::RecordAsyncPhase(LifecyclePhase phase,
                                        double durationMs) {
  auto &stats = Stats(phase);
  stats.last_async_ms = durationMs;
  stats.async_total_ms += durationMs;
}

InvalidationOutcome
LifecycleMetrics::ClassifyInvalidation(bool renderAlreadyQueued,
                                       bool gateDeclined) {
  if (renderAlreadyQueued) {
    return InvalidationOutcome::SuppressedAlreadyQueued;
  }
  if (gateDeclined) {
    return InvalidationOutcome::SuppressedByPolicy;
  }
  return InvalidationOutcome::Honored;
}

InvalidationOutcome LifecycleMetrics::RecordInvalidation(bool renderAlreadyQueued,
                                                         bool gateDeclined) {
  fInvalidationCalls++;
  auto outcome = ClassifyInvalidation(renderAlreadyQueued, gateDeclined);
  switch (outcome) {
  case InvalidationOutcome::Honored:
    fHonored++;
    break;
  case InvalidationOutcome::SuppressedAlreadyQueued:
    fSuppressedQueued++;
    break;
  case InvalidationOutcome::SuppressedByPolicy:
    fSuppressedPolicy++;
    break;
  }
  return outcome;
}

void LifecycleMetrics::RecordGateDecision(bool allowed) {
  if (allowed) {
    fGateAllowed++;
  } else {
    fGateDeclined++;
  }
  fLastGateDecision = allowed;
}

void LifecycleMetrics::MarkDisposed(Clock::time_point at) {
  if (!fDisposedAt) {
    fDisposedAt = at;
  }
}

uint64_t LifecycleMetrics::GetCallCount(LifecyclePhase phase) const {
  return Stats(phase).calls;
}

std::optional<double>
LifecycleMetrics::GetLastDuration(LifecyclePhase phase) const {
  return Stats(phase).last_ms;
}

double LifecycleMetrics::GetTotalDuration(LifecyclePhase phase) const {
  return Stats(phase).total_ms;
}

double LifecycleMetrics::GetAsyncTotalDuration(LifecyclePhase phase) const {
  return Stats(phase).async_total_ms;
}

std::optional<double>
LifecycleMetrics::GetLastAsyncDuration(LifecyclePhase phase) const {
  return Stats(phase).last_async_ms;
}

std::optional<double>
LifecycleMetrics::GetAverageDuration(LifecyclePhase phase) const {
  const auto &stats = Stats(phase);
  if (stats.calls == 0) {
    return std::nullopt;
  }
  return stats.total_ms / static_cast<double>(stats.calls);
}

double LifecycleMetrics::GetLifetimeMs(Clock::time_point now) const {
  return MillisecondsBetween(fCreatedAt, fDisposedAt ? *fDisposedAt : now);
}

std::optional<double> LifecycleMetrics::GetInvalidationEfficiency() const {
  return Ratio(GetRenderCount(), fInvalidationCalls);
}

std::optional<double> LifecycleMetrics::GetSuppressionRatio() const {
  return Ratio(fSuppressedQueued + fSuppressedPolicy, fInvalidationCalls);
}

std::optional<double> LifecycleMetrics::GetGateBlockRate() const {
  return Ratio(fGateDeclined, fGateAllowed + fGateDeclined);
}

double LifecycleMetrics::GetTotalSyncLifecycleMs() const {
  return Stats(LifecyclePhase::Initialize).total_ms +
         Stats(LifecyclePhase::ParameterSet).total_ms +
         Stats(LifecyclePhase::Render).total_ms +
         Stats(LifecyclePhase::PostRender).total_ms;
}

std::optional<double>
LifecycleMetrics::GetRendersPerMinute(Clock::time_point now) const {
  double lifetimeMs = GetLifetimeMs(now);
  if (lifetimeMs <= 0.0) {
    return std::nullopt;
  }
  return static_cast<double>(GetRenderCount()) / (lifetimeMs / 60000.0);
}

} // namespace Tracking
} // namespace SHADE
