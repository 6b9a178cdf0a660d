#ifndef SHADE_TRACKING_COMPONENT_REGISTRY_HPP
#define SHADE_TRACKING_COMPONENT_REGISTRY_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

#include "shade/core/ComponentMode.hpp"
#include "shade/core/ComponentTypeInfo.hpp"
#include "shade/core/Identifiers.hpp"
#include "shade/tracking/ComponentStateReader.hpp"
#include "shade/tracking/HostTreeIntrospector.hpp"
#include "shade/tracking/LifecycleMetrics.hpp"
#include "shade/tracking/WeakIdentityMap.hpp"

namespace SHADE {
namespace Tracking {

/**
 * @brief Read-only copy of one component record
 */
struct ComponentSummary {
  ComponentId id = kSessionComponentId; ///< -1 while pending
  ComponentTypeInfo type;
  std::optional<ComponentId> parent_id;
  LifecycleState state = LifecycleState::Pending;
  ComponentMode mode = ComponentMode::Basic;
  int64_t created_at_ms = 0;  ///< Wall clock, ms since epoch
  bool instance_alive = false;

  std::optional<LifecycleMetrics> metrics; ///< Enhanced records only

  uint64_t basic_render_count = 0;
  std::optional<int64_t> last_basic_render_ms; ///< Wall clock, ms since epoch

  ComponentDetails details; ///< Empty while pending or without a state reader
};

struct ComponentCounts {
  size_t resolved = 0;
  size_t pending = 0;
  size_t total = 0;
};

/// Lightweight lookup used on the instrumentation hot path
struct InstanceInfo {
  ComponentId id = kSessionComponentId;
  ComponentTypeInfo type;
  ComponentMode mode = ComponentMode::Basic;
  LifecycleState state = LifecycleState::Pending;
};

/**
 * @brief Per-session shadow of the host's component set
 *
 * Records enter as Pending from the creation hook and become Resolved
 * either directly (attach hook) or through reconciliation against the host
 * tree. Resolved records absent from the host tree are deleted. Instances
 * are held weakly; the registry never keeps a component alive.
 *
 * All state sits behind one mutex, held for a whole reconciliation pass.
 */
class ComponentRegistry {
public:
  using Clock = std::chrono::steady_clock;

  explicit ComponentRegistry(
      std::shared_ptr<IHostTreeIntrospector> introspector,
      std::chrono::milliseconds reconcileInterval = std::chrono::milliseconds(1000));

  ComponentRegistry(const ComponentRegistry &) = delete;
  ComponentRegistry &operator=(const ComponentRegistry &) = delete;

  // === Lifecycle transitions ===

  /// Insert (or overwrite) a Pending record; a null instance is rejected
  bool RegisterPending(const std::shared_ptr<void> &instance,
                       const ComponentTypeInfo &type,
                       ComponentMode mode = ComponentMode::Enhanced);

  /// Promote Pending -> Resolved; false if the instance was never pending
  bool ResolveDirect(const std::shared_ptr<void> &instance, ComponentId id);

  /**
   * @brief Remove the pending or resolved record of instance
   *
   * The host may still list the component until its next tree update. The
   * removed id and instance stay tombstoned until a snapshot no longer
   * reports them, so reconciliation does not bring them back.
   */
  bool Unregister(const std::shared_ptr<void> &instance);

  // === Reconciliation ===

  /**
   * @brief Throttled pass against the introspector's snapshot
   * @return true if a pass ran
   *
   * Never throws. Unsupported or failing introspection leaves state as is.
   */
  bool Reconcile();

  /// Unthrottled pass against a caller-supplied snapshot
  void ReconcileWith(const HostTreeSnapshot &snapshot);

  bool IsIntrospectionSupported() const;
  uint64_t GetReconcilePassCount() const;

  // === Queries (each runs a throttled Reconcile first) ===

  std::optional<ComponentSummary> GetComponent(ComponentId id);

  /// Resolved records by id, then pending records by registration order
  std::vector<ComponentSummary> GetAllComponents();

  /// Root first, then descendants breadth-first; empty if root is unknown
  std::vector<ComponentSummary> GetSubtree(ComponentId rootId);

  ComponentCounts GetCounts();

  // === Hot-path accessors (no reconciliation) ===

  std::optional<ComponentId> GetComponentId(const std::shared_ptr<void> &instance);
  std::optional<InstanceInfo> DescribeInstance(const std::shared_ptr<void> &instance);

  // === Inspection data ===

  /**
   * @brief Install the reader used to capture parameters and state
   *
   * Details are captured when a record resolves. Internal state flags are
   * refreshed on Basic renders and read live for Enhanced components when
   * summarized.
   */
  void SetStateReader(std::shared_ptr<IComponentStateReader> reader);

  /// Re-read parameters, tracked state and flags of a resolved instance
  bool RefreshDetails(const std::shared_ptr<void> &instance);

  /// Run fn on the metrics of an Enhanced record under the registry lock
  bool UpdateMetrics(const std::shared_ptr<void> &instance,
                     const std::function<void(LifecycleMetrics &)> &fn);

  /// Count a host-reported render of a resolved component
  bool RecordBasicRender(ComponentId id);

  // === Maintenance ===

  /// Drop pending records whose instance has been destroyed
  size_t PurgeCollected();

  void Clear();

private:
  struct Record {
    std::optional<ComponentId> id;
    ComponentTypeInfo type;
    std::optional<ComponentId> parent_id;
    LifecycleState state = LifecycleState::Pending;
    ComponentMode mode = ComponentMode::Basic;
    std::weak_ptr<void> instance;
    std::chrono::system_clock::time_point created_wall;
    uint64_t order = 0;
    std::optional<LifecycleMetrics> metrics;
    uint64_t basic_render_count = 0;
    std::optional<std::chrono::system_clock::time_point> last_basic_render;
    ComponentDetails details;
  };

  bool ReconcileLocked();
  void ApplySnapshotLocked(const HostTreeSnapshot &snapshot);
  void PromoteLocked(Record record, ComponentId id,
                     std::optional<ComponentId> parentId,
                     const std::shared_ptr<void> &instance);
  void EraseResolvedLocked(ComponentId id);
  bool IsTombstonedLocked(ComponentId id, const HostTreeEntry &entry) const;
  void ExpireTombstonesLocked(const HostTreeSnapshot &snapshot);
  Record *FindByInstanceLocked(const std::shared_ptr<void> &instance);
  void CaptureDetailsLocked(Record &record, const std::shared_ptr<void> &instance);
  void RefreshInternalStateLocked(Record &record);
  ComponentSummary SummarizeLocked(const Record &record);

  std::shared_ptr<IHostTreeIntrospector> fIntrospector;
  std::shared_ptr<IComponentStateReader> fStateReader;
  const std::chrono::milliseconds fReconcileInterval;

  mutable std::mutex fMutex;
  WeakIdentityMap<Record> fPending;
  std::map<ComponentId, Record> fResolved;
  WeakIdentityMap<ComponentId> fResolvedIndex;

  // Unregistered components the host may still report; the flag marks
  // instances seen in the current pass
  std::set<ComponentId> fRemovedIds;
  WeakIdentityMap<bool> fRemovedInstances;

  std::optional<Clock::time_point> fLastReconcile;
  uint64_t fNextOrder = 0;
  uint64_t fReconcilePasses = 0;
  bool fUnsupportedLogged = false;
  bool fHostTreeUnsupported = false;
};

} // namespace Tracking
} // namespace SHADE

#endif // SHADE_TRACKING_COMPONENT_REGISTRY_HPP
