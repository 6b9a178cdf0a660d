#ifndef SHADE_RUNTIME_INSTRUMENTATION_HOOKS_HPP
#define SHADE_RUNTIME_INSTRUMENTATION_HOOKS_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "shade/core/ComponentMode.hpp"
#include "shade/core/ComponentTypeInfo.hpp"
#include "shade/core/LifecyclePhase.hpp"
#include "shade/core/ShadeConfig.hpp"
#include "shade/runtime/Session.hpp"

namespace SHADE {
namespace Runtime {

/**
 * @brief Entry points the host runtime calls at its lifecycle boundaries
 *
 * Every hook updates the session registry and metrics and appends a
 * timeline event. No std::exception raised inside SHADE escapes a hook:
 * failures are logged and counted, and the host's render proceeds.
 *
 * Durations are in milliseconds as measured by the host. Hooks for an
 * instance that is not tracked (never created, excluded, or already
 * disposed) are silent no-ops.
 */
class InstrumentationHooks {
public:
  InstrumentationHooks(std::shared_ptr<Session> session,
                       InstrumentationConfig config = InstrumentationConfig());

  InstrumentationHooks(const InstrumentationHooks &) = delete;
  InstrumentationHooks &operator=(const InstrumentationHooks &) = delete;

  // === Identity ===
  void OnCreate(const std::shared_ptr<void> &instance,
                const ComponentTypeInfo &type,
                ComponentMode mode = ComponentMode::Enhanced);
  void OnAttach(const std::shared_ptr<void> &instance, ComponentId id);
  void OnDispose(const std::shared_ptr<void> &instance);

  // === Timed lifecycle phases ===
  void OnInitialized(const std::shared_ptr<void> &instance, double durationMs,
                     bool isAsync = false);
  void OnParametersSet(const std::shared_ptr<void> &instance, double durationMs,
                       bool isAsync = false);
  void OnRender(const std::shared_ptr<void> &instance, double durationMs,
                bool firstRender);
  void OnPostRender(const std::shared_ptr<void> &instance, double durationMs,
                    bool firstRender, bool isAsync = false);
  void OnCallbackInvoked(const std::shared_ptr<void> &instance, double durationMs,
                         const std::string &callbackName = "");

  // === Render requests ===
  InvalidationOutcome OnInvalidate(const std::shared_ptr<void> &instance,
                                   bool renderAlreadyQueued, bool gateDeclined);
  void OnGateDecision(const std::shared_ptr<void> &instance, bool allowed);

  // === Host-level observations ===

  /// Render of a component known only by id (Basic mode)
  void OnBasicRender(ComponentId id, const std::string &typeName,
                     std::optional<double> durationMs = std::nullopt,
                     bool firstRender = false);
  BatchId OnBatchStarted(const std::string &triggerSource);
  void OnBatchCompleted(BatchId batchId,
                        const std::vector<ComponentId> &componentIds);
  void OnNavigation(const std::string &location);

  uint64_t GetSwallowedFailureCount() const { return fSwallowed.load(); }
  const InstrumentationConfig &GetConfig() const { return fConfig; }
  const std::shared_ptr<Session> &GetSession() const { return fSession; }

private:
  template <typename Fn> void Guard(const char *hook, Fn &&fn);

  bool IsExcluded(const ComponentTypeInfo &type) const;
  bool IsKindEnabled(EventKind kind) const;
  double Timed(double durationMs) const;

  void TimedPhase(const char *hook, const std::shared_ptr<void> &instance,
                  LifecyclePhase phase, EventKind kind, double durationMs,
                  bool isAsync, bool firstRender);
  void Emit(ComponentId id, const std::string &typeName, EventKind kind,
            Timeline::EventOptions options);

  std::shared_ptr<Session> fSession;
  const InstrumentationConfig fConfig;
  std::atomic<uint64_t> fSwallowed{0};
};

} // namespace Runtime
} // namespace SHADE

#endif // SHADE_RUNTIME_INSTRUMENTATION_HOOKS_HPP
