#ifndef SHADE_TRACKING_LIFECYCLE_METRICS_HPP
#define SHADE_TRACKING_LIFECYCLE_METRICS_HPP

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>

#include "shade/core/LifecyclePhase.hpp"

namespace SHADE {
namespace Tracking {

/**
 * @brief Per-instance counters and timers of an enhanced component
 *
 * Only raw observations are stored. Averages, ratios and rates are
 * computed on read; a ratio with a zero denominator is std::nullopt.
 *
 * Not thread-safe; the owning registry serializes access.
 */
class LifecycleMetrics {
public:
  using Clock = std::chrono::steady_clock;

  explicit LifecycleMetrics(Clock::time_point createdAt = Clock::now());

  // === Recording ===

  /**
   * @brief Record one synchronous call of a lifecycle phase
   *
   * The first Render call freezes time-to-first-render relative to the
   * creation time.
   */
  void RecordPhase(LifecyclePhase phase, double durationMs,
                   Clock::time_point at = Clock::now());

  /// Continuation time of an awaited phase; does not count as a call
  void RecordAsyncPhase(LifecyclePhase phase, double durationMs);

  /**
   * @brief Count an invalidation request and classify it
   *
   * Renders already queued win over a declined render gate.
   */
  InvalidationOutcome RecordInvalidation(bool renderAlreadyQueued,
                                         bool gateDeclined);

  static InvalidationOutcome ClassifyInvalidation(bool renderAlreadyQueued,
                                                  bool gateDeclined);

  void RecordGateDecision(bool allowed);

  void MarkDisposed(Clock::time_point at = Clock::now());

  // === Raw observations ===

  uint64_t GetCallCount(LifecyclePhase phase) const;
  std::optional<double> GetLastDuration(LifecyclePhase phase) const;
  double GetTotalDuration(LifecyclePhase phase) const;
  double GetAsyncTotalDuration(LifecyclePhase phase) const;
  std::optional<double> GetLastAsyncDuration(LifecyclePhase phase) const;

  uint64_t GetRenderCount() const {
    return GetCallCount(LifecyclePhase::Render);
  }
  std::optional<double> GetMaxRenderDuration() const { return fMaxRenderMs; }
  std::optional<double> GetMinRenderDuration() const { return fMinRenderMs; }
  std::optional<double> GetMaxEventCallbackDuration() const {
    return fMaxCallbackMs;
  }

  uint64_t GetInvalidationCalls() const { return fInvalidationCalls; }
  uint64_t GetHonoredInvalidations() const { return fHonored; }
  uint64_t GetSuppressedAlreadyQueued() const { return fSuppressedQueued; }
  uint64_t GetSuppressedByPolicy() const { return fSuppressedPolicy; }

  uint64_t GetGateAllowed() const { return fGateAllowed; }
  uint64_t GetGateDeclined() const { return fGateDeclined; }
  std::optional<bool> GetLastGateDecision() const { return fLastGateDecision; }

  Clock::time_point GetCreatedAt() const { return fCreatedAt; }
  bool IsDisposed() const { return fDisposedAt.has_value(); }

  // === Derived on read ===

  std::optional<double> GetAverageDuration(LifecyclePhase phase) const;

  /// (disposal time or now) minus creation time, in ms
  double GetLifetimeMs(Clock::time_point now = Clock::now()) const;

  std::optional<double> GetTimeToFirstRenderMs() const {
    return fTimeToFirstRenderMs;
  }

  /// renders / invalidation calls
  std::optional<double> GetInvalidationEfficiency() const;

  /// (suppressed already queued + suppressed by policy) / invalidation calls
  std::optional<double> GetSuppressionRatio() const;

  /// declined / gate decisions
  std::optional<double> GetGateBlockRate() const;

  /// Sum of synchronous totals of initialize, parameter-set, render and
  /// post-render
  double GetTotalSyncLifecycleMs() const;

  std::optional<double>
  GetRendersPerMinute(Clock::time_point now = Clock::now()) const;

private:
  struct PhaseStats {
    uint64_t calls = 0;
    std::optional<double> last_ms;
    double total_ms = 0.0;
    std::optional<double> last_async_ms;
    double async_total_ms = 0.0;
  };

  const PhaseStats &Stats(LifecyclePhase phase) const {
    return fPhases[static_cast<size_t>(phase)];
  }
  PhaseStats &Stats(LifecyclePhase phase) {
    return fPhases[static_cast<size_t>(phase)];
  }

  Clock::time_point fCreatedAt;
  std::optional<Clock::time_point> fDisposedAt;

  std::array<PhaseStats, kLifecyclePhaseCount> fPhases{};
  std::optional<double> fMaxRenderMs;
  std::optional<double> fMinRenderMs;
  std::optional<double> fMaxCallbackMs;
  std::optional<double> fTimeToFirstRenderMs;

  uint64_t fInvalidationCalls = 0;
  uint64_t fHonored = 0;
  uint64_t fSuppressedQueued = 0;
  uint64_t fSuppressedPolicy = 0;

  uint64_t fGateAllowed = 0;
  uint64_t fGateDeclined = 0;
  std::optional<bool> fLastGateDecision;
};

} // namespace Tracking
} // namespace SHADE

#endif // SHADE_TRACKING_LIFECYCLE_METRICS_HPP
