#include "shade/tracking/ComponentRegistry.hpp"

#include <algorithm>
#include <deque>
#include <limits>
#include <set>
#include <unordered_map>

#include "shade/util/Logger.hpp"

namespace SHADE {
namespace Tracking {

using Util::Error;
using Util::Logger;
using Util::Subsystem;

namespace {

int64_t ToEpochMs(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// Host readers are best-effort; a throwing read leaves the field empty
template <typename Fn> void ReadSafely(const char *what, Fn &&fn) {
  try {
    fn();
  } catch (const std::exception &e) {
    Logger::GetLogger(Subsystem::Tracking)
        ->Debug("Reading %s failed: %s", what, e.what());
  }
}

} // namespace

ComponentRegistry::ComponentRegistry(
    std::shared_ptr<IHostTreeIntrospector> introspector,
    std::chrono::milliseconds reconcileInterval)
    : fIntrospector(std::move(introspector)),
      fReconcileInterval(reconcileInterval) {}

// === Lifecycle transitions ===

bool ComponentRegistry::RegisterPending(const std::shared_ptr<void> &instance,
                                        const ComponentTypeInfo &type,
                                        ComponentMode mode) {
  if (!instance) {
    return false;
  }

  Record record;
  record.type = type;
  record.mode = mode;
  record.state = LifecycleState::Pending;
  record.instance = instance;
  record.created_wall = std::chrono::system_clock::now();
  if (mode == ComponentMode::Enhanced) {
    record.metrics.emplace(Clock::now());
  }

  std::lock_guard<std::mutex> lock(fMutex);
  record.order = fNextOrder++;
  fRemovedInstances.Erase(instance);
  return fPending.Insert(instance, std::move(record));
}

bool ComponentRegistry::ResolveDirect(const std::shared_ptr<void> &instance,
                                      ComponentId id) {
  std::lock_guard<std::mutex> lock(fMutex);
  Record record;
  if (!fPending.Take(instance, record)) {
    return false;
  }
  fRemovedIds.erase(id);
  PromoteLocked(std::move(record), id, std::nullopt, instance);
  return true;
}

bool ComponentRegistry::Unregister(const std::shared_ptr<void> &instance) {
  std::lock_guard<std::mutex> lock(fMutex);
  std::optional<ComponentId> removedId;
  if (!fPending.Erase(instance)) {
    const ComponentId *id = fResolvedIndex.Find(instance);
    if (!id) {
      return false;
    }
    removedId = *id;
    EraseResolvedLocked(*id);
  }

  // Without any host tree nothing can resurrect the record
  if (!fHostTreeUnsupported || fReconcilePasses > 0) {
    fRemovedInstances.Insert(instance, false);
    if (removedId) {
      fRemovedIds.insert(*removedId);
    }
  }
  return true;
}

// === Reconciliation ===

bool ComponentRegistry::Reconcile() {
  std::lock_guard<std::mutex> lock(fMutex);
  return ReconcileLocked();
}

void ComponentRegistry::ReconcileWith(const HostTreeSnapshot &snapshot) {
  std::lock_guard<std::mutex> lock(fMutex);
  ApplySnapshotLocked(snapshot);
}

bool ComponentRegistry::IsIntrospectionSupported() const {
  if (!fIntrospector) {
    return false;
  }
  try {
    return fIntrospector->IsSupported();
  } catch (const std::exception &e) {
    Logger::GetLogger(Subsystem::Tracking)
        ->Warning(std::string("Introspector support check failed: ") + e.what());
    return false;
  }
}

uint64_t ComponentRegistry::GetReconcilePassCount() const {
  std::lock_guard<std::mutex> lock(fMutex);
  return fReconcilePasses;
}

bool ComponentRegistry::ReconcileLocked() {
  auto now = Clock::now();
  if (fLastReconcile && fReconcileInterval.count() > 0 &&
      now - *fLastReconcile < fReconcileInterval) {
    return false;
  }
  fLastReconcile = now;

  if (!fIntrospector) {
    return false;
  }

  auto logger = Logger::GetLogger(Subsystem::Tracking);
  try {
    if (!fIntrospector->IsSupported()) {
      if (!fUnsupportedLogged) {
        logger->Info("Host tree introspection unsupported; serving direct "
                     "resolutions only");
        fUnsupportedLogged = true;
      }
      fHostTreeUnsupported = true;
      return false;
    }

    auto result = fIntrospector->IntrospectTree();
    if (!Util::isOk(result)) {
      const auto &error = Util::getError(result);
      if (error.code == Error::INTROSPECTION_UNSUPPORTED) {
        if (!fUnsupportedLogged) {
          logger->Info("Host tree introspection unsupported: " + error.message);
          fUnsupportedLogged = true;
        }
        fHostTreeUnsupported = true;
      } else {
        logger->Warning("Reconciliation skipped: " + error.message);
      }
      return false;
    }

    ApplySnapshotLocked(Util::getValue(result));
    return true;
  } catch (const std::exception &e) {
    logger->Warning(std::string("Reconciliation failed: ") + e.what());
    return false;
  }
}

void ComponentRegistry::ApplySnapshotLocked(const HostTreeSnapshot &snapshot) {
  fPending.Purge();
  fResolvedIndex.Purge();

  // Pending records whose instance is in the snapshot
  std::unordered_map<const void *, ComponentId> byInstance;
  for (const auto &kv : snapshot) {
    if (kv.second.instance) {
      byInstance[kv.second.instance.get()] = kv.first;
    }
  }

  std::vector<std::pair<std::shared_ptr<void>, ComponentId>> matches;
  fPending.ForEach([&](const std::shared_ptr<void> &instance, Record &) {
    auto it = byInstance.find(instance.get());
    if (it != byInstance.end()) {
      matches.emplace_back(instance, it->second);
    }
  });

  size_t promoted = 0;
  for (const auto &match : matches) {
    Record record;
    if (fPending.Take(match.first, record)) {
      const auto &entry = snapshot.at(match.second);
      PromoteLocked(std::move(record), match.second, entry.parent_id,
                    match.first);
      promoted++;
    }
  }

  // Lower-confidence fallback: entries without an instance reference claim
  // the earliest registered Basic pending record of the same type
  for (const auto &kv : snapshot) {
    const auto &entry = kv.second;
    if (entry.instance || fResolved.count(kv.first) != 0 ||
        entry.type.full_name.empty() || fRemovedIds.count(kv.first) != 0) {
      continue;
    }

    std::shared_ptr<void> best;
    uint64_t bestOrder = std::numeric_limits<uint64_t>::max();
    fPending.ForEach([&](const std::shared_ptr<void> &instance, Record &record) {
      if (record.mode == ComponentMode::Basic &&
          record.type.full_name == entry.type.full_name &&
          record.order < bestOrder) {
        best = instance;
        bestOrder = record.order;
      }
    });

    Record record;
    if (best && fPending.Take(best, record)) {
      PromoteLocked(std::move(record), kv.first, entry.parent_id, best);
      promoted++;
    }
  }

  // Refresh parents of known records
  for (auto &kv : fResolved) {
    auto it = snapshot.find(kv.first);
    if (it == snapshot.end()) {
      continue;
    }
    kv.second.parent_id = it->second.parent_id;
    if (kv.second.type.full_name.empty()) {
      kv.second.type = it->second.type;
    }
  }

  // Synthesize Basic records for ids only the host knows about
  size_t synthesized = 0;
  auto nowWall = std::chrono::system_clock::now();
  for (const auto &kv : snapshot) {
    if (fResolved.count(kv.first) != 0) {
      continue;
    }
    const auto &entry = kv.second;
    if (entry.instance && fPending.Contains(entry.instance)) {
      continue;
    }
    if (IsTombstonedLocked(kv.first, entry)) {
      continue;
    }

    Record record;
    record.id = kv.first;
    record.type = entry.type;
    record.parent_id = entry.parent_id;
    record.state = LifecycleState::Resolved;
    record.mode = ComponentMode::Basic;
    record.instance = entry.instance;
    record.created_wall = nowWall;
    record.order = fNextOrder++;
    CaptureDetailsLocked(record, entry.instance);
    fResolved.emplace(kv.first, std::move(record));
    if (entry.instance) {
      fResolvedIndex.Insert(entry.instance, kv.first);
    }
    synthesized++;
  }

  // Drop records the host no longer reports
  std::vector<ComponentId> stale;
  for (const auto &kv : fResolved) {
    if (snapshot.find(kv.first) == snapshot.end()) {
      stale.push_back(kv.first);
    }
  }
  for (ComponentId id : stale) {
    EraseResolvedLocked(id);
  }
  ExpireTombstonesLocked(snapshot);

  fReconcilePasses++;
  Logger::GetLogger(Subsystem::Tracking)
      ->Debug("Reconcile pass %llu: %zu in tree, %zu promoted, %zu synthesized, "
              "%zu removed, %zu still pending",
              static_cast<unsigned long long>(fReconcilePasses), snapshot.size(),
              promoted, synthesized, stale.size(), fPending.Size());
}

bool ComponentRegistry::IsTombstonedLocked(ComponentId id,
                                           const HostTreeEntry &entry) const {
  if (fRemovedIds.count(id) != 0) {
    return true;
  }
  return entry.instance && fRemovedInstances.Contains(entry.instance);
}

void ComponentRegistry::ExpireTombstonesLocked(const HostTreeSnapshot &snapshot) {
  for (auto it = fRemovedIds.begin(); it != fRemovedIds.end();) {
    if (snapshot.find(*it) == snapshot.end()) {
      it = fRemovedIds.erase(it);
    } else {
      ++it;
    }
  }
  for (const auto &kv : snapshot) {
    if (!kv.second.instance) {
      continue;
    }
    if (bool *seen = fRemovedInstances.Find(kv.second.instance)) {
      *seen = true;
    }
  }
  fRemovedInstances.EraseIf([](bool seen) { return !seen; });
  fRemovedInstances.ForEach(
      [](const std::shared_ptr<void> &, bool &seen) { seen = false; });
}

void ComponentRegistry::PromoteLocked(Record record, ComponentId id,
                                      std::optional<ComponentId> parentId,
                                      const std::shared_ptr<void> &instance) {
  if (fResolved.count(id) != 0) {
    EraseResolvedLocked(id);
  }
  if (const ComponentId *previous = fResolvedIndex.Find(instance)) {
    if (*previous != id) {
      EraseResolvedLocked(*previous);
    }
  }

  record.id = id;
  record.parent_id = parentId;
  record.state = LifecycleState::Resolved;
  CaptureDetailsLocked(record, instance);
  fResolved[id] = std::move(record);
  fResolvedIndex.Insert(instance, id);
}

void ComponentRegistry::EraseResolvedLocked(ComponentId id) {
  auto it = fResolved.find(id);
  if (it == fResolved.end()) {
    return;
  }
  if (auto instance = it->second.instance.lock()) {
    const ComponentId *indexed = fResolvedIndex.Find(instance);
    if (indexed && *indexed == id) {
      fResolvedIndex.Erase(instance);
    }
  }
  fResolved.erase(it);
}

// === Queries ===

void ComponentRegistry::CaptureDetailsLocked(Record &record,
                                             const std::shared_ptr<void> &instance) {
  if (!fStateReader) {
    return;
  }
  ComponentDetails details;
  ReadSafely("source location",
             [&] { details.source = fStateReader->LocateSource(record.type); });
  if (instance) {
    ReadSafely("parameters",
               [&] { details.parameters = fStateReader->ReadParameters(instance); });
    ReadSafely("tracked state", [&] {
      details.tracked_state = fStateReader->ReadTrackedState(instance);
    });
    ReadSafely("internal state", [&] {
      details.internal_state = fStateReader->ReadInternalState(instance);
    });
  }
  record.details = std::move(details);
}

void ComponentRegistry::RefreshInternalStateLocked(Record &record) {
  auto instance = record.instance.lock();
  if (!fStateReader || !instance) {
    return;
  }
  ReadSafely("internal state", [&] {
    record.details.internal_state = fStateReader->ReadInternalState(instance);
  });
}

ComponentSummary ComponentRegistry::SummarizeLocked(const Record &record) {
  ComponentSummary summary;
  summary.id = record.id.value_or(kSessionComponentId);
  summary.type = record.type;
  summary.parent_id = record.parent_id;
  summary.state = record.state;
  summary.mode = record.mode;
  summary.created_at_ms = ToEpochMs(record.created_wall);
  summary.instance_alive = !record.instance.expired();
  summary.metrics = record.metrics;
  summary.basic_render_count = record.basic_render_count;
  if (record.last_basic_render) {
    summary.last_basic_render_ms = ToEpochMs(*record.last_basic_render);
  }
  if (record.state == LifecycleState::Resolved) {
    summary.details = record.details;
    auto instance = record.instance.lock();
    if (fStateReader && instance && record.mode == ComponentMode::Enhanced) {
      ReadSafely("internal state", [&] {
        summary.details.internal_state = fStateReader->ReadInternalState(instance);
      });
    }
  }
  return summary;
}

std::optional<ComponentSummary> ComponentRegistry::GetComponent(ComponentId id) {
  std::lock_guard<std::mutex> lock(fMutex);
  ReconcileLocked();
  auto it = fResolved.find(id);
  if (it == fResolved.end()) {
    return std::nullopt;
  }
  return SummarizeLocked(it->second);
}

std::vector<ComponentSummary> ComponentRegistry::GetAllComponents() {
  std::lock_guard<std::mutex> lock(fMutex);
  ReconcileLocked();
  fPending.Purge();

  std::vector<ComponentSummary> result;
  result.reserve(fResolved.size() + fPending.Size());
  for (const auto &kv : fResolved) {
    result.push_back(SummarizeLocked(kv.second));
  }

  std::vector<const Record *> pending;
  fPending.ForEach([&](const std::shared_ptr<void> &, Record &record) {
    pending.push_back(&record);
  });
  std::sort(pending.begin(), pending.end(),
            [](const Record *a, const Record *b) { return a->order < b->order; });
  for (const Record *record : pending) {
    result.push_back(SummarizeLocked(*record));
  }
  return result;
}

std::vector<ComponentSummary> ComponentRegistry::GetSubtree(ComponentId rootId) {
  std::lock_guard<std::mutex> lock(fMutex);
  ReconcileLocked();

  std::vector<ComponentSummary> result;
  if (fResolved.find(rootId) == fResolved.end()) {
    return result;
  }

  std::map<ComponentId, std::vector<ComponentId>> children;
  for (const auto &kv : fResolved) {
    if (kv.second.parent_id) {
      children[*kv.second.parent_id].push_back(kv.first);
    }
  }

  std::deque<ComponentId> queue{rootId};
  std::set<ComponentId> visited{rootId};
  while (!queue.empty()) {
    ComponentId current = queue.front();
    queue.pop_front();
    result.push_back(SummarizeLocked(fResolved.at(current)));

    auto it = children.find(current);
    if (it == children.end()) {
      continue;
    }
    for (ComponentId child : it->second) {
      if (visited.insert(child).second) {
        queue.push_back(child);
      }
    }
  }
  return result;
}

ComponentCounts ComponentRegistry::GetCounts() {
  std::lock_guard<std::mutex> lock(fMutex);
  ReconcileLocked();
  fPending.Purge();

  ComponentCounts counts;
  counts.resolved = fResolved.size();
  counts.pending = fPending.Size();
  counts.total = counts.resolved + counts.pending;
  return counts;
}

// === Hot-path accessors ===

ComponentRegistry::Record *
ComponentRegistry::FindByInstanceLocked(const std::shared_ptr<void> &instance) {
  if (Record *pending = fPending.Find(instance)) {
    return pending;
  }
  const ComponentId *id = fResolvedIndex.Find(instance);
  if (!id) {
    return nullptr;
  }
  auto it = fResolved.find(*id);
  return it == fResolved.end() ? nullptr : &it->second;
}

std::optional<ComponentId>
ComponentRegistry::GetComponentId(const std::shared_ptr<void> &instance) {
  std::lock_guard<std::mutex> lock(fMutex);
  const ComponentId *id = fResolvedIndex.Find(instance);
  if (!id) {
    return std::nullopt;
  }
  return *id;
}

std::optional<InstanceInfo>
ComponentRegistry::DescribeInstance(const std::shared_ptr<void> &instance) {
  std::lock_guard<std::mutex> lock(fMutex);
  const Record *record = FindByInstanceLocked(instance);
  if (!record) {
    return std::nullopt;
  }
  InstanceInfo info;
  info.id = record->id.value_or(kSessionComponentId);
  info.type = record->type;
  info.mode = record->mode;
  info.state = record->state;
  return info;
}

bool ComponentRegistry::UpdateMetrics(
    const std::shared_ptr<void> &instance,
    const std::function<void(LifecycleMetrics &)> &fn) {
  std::lock_guard<std::mutex> lock(fMutex);
  Record *record = FindByInstanceLocked(instance);
  if (!record || !record->metrics) {
    return false;
  }
  fn(*record->metrics);
  return true;
}

bool ComponentRegistry::RecordBasicRender(ComponentId id) {
  std::lock_guard<std::mutex> lock(fMutex);
  auto it = fResolved.find(id);
  if (it == fResolved.end()) {
    return false;
  }
  it->second.basic_render_count++;
  it->second.last_basic_render = std::chrono::system_clock::now();
  RefreshInternalStateLocked(it->second);
  return true;
}

// === Inspection data ===

void ComponentRegistry::SetStateReader(std::shared_ptr<IComponentStateReader> reader) {
  std::lock_guard<std::mutex> lock(fMutex);
  fStateReader = std::move(reader);
}

bool ComponentRegistry::RefreshDetails(const std::shared_ptr<void> &instance) {
  std::lock_guard<std::mutex> lock(fMutex);
  const ComponentId *id = fResolvedIndex.Find(instance);
  if (!id || !fStateReader) {
    return false;
  }
  auto it = fResolved.find(*id);
  if (it == fResolved.end()) {
    return false;
  }
  CaptureDetailsLocked(it->second, instance);
  return true;
}

// === Maintenance ===

size_t ComponentRegistry::PurgeCollected() {
  std::lock_guard<std::mutex> lock(fMutex);
  fResolvedIndex.Purge();
  return fPending.Purge();
}

void ComponentRegistry::Clear() {
  std::lock_guard<std::mutex> lock(fMutex);
  fPending.Clear();
  fResolved.clear();
  fResolvedIndex.Clear();
  fRemovedIds.clear();
  fRemovedInstances.Clear();
  fLastReconcile.reset();
}

} // namespace Tracking
} // namespace SHADE
