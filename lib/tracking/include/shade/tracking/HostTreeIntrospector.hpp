#ifndef SHADE_TRACKING_HOST_TREE_INTROSPECTOR_HPP
#define SHADE_TRACKING_HOST_TREE_INTROSPECTOR_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "shade/core/ComponentTypeInfo.hpp"
#include "shade/core/Identifiers.hpp"
#include "shade/util/Error.hpp"

namespace SHADE {
namespace Tracking {

/**
 * @brief One component as reported by the host's authoritative tree
 *
 * instance may be null when the host exposes the id but not the object.
 */
struct HostTreeEntry {
  std::shared_ptr<void> instance;
  std::optional<ComponentId> parent_id;
  ComponentTypeInfo type;
};

/// id -> entry; read once per reconciliation pass and then dropped
using HostTreeSnapshot = std::map<ComponentId, HostTreeEntry>;

/**
 * @brief Capability to read the host's component tree
 *
 * Implementations report INTROSPECTION_UNSUPPORTED when the host internals
 * are unreachable. That condition is permanent for a given host version.
 */
class IHostTreeIntrospector {
public:
  virtual ~IHostTreeIntrospector() = default;

  virtual bool IsSupported() const = 0;
  virtual Util::Result<HostTreeSnapshot> IntrospectTree() = 0;
};

/**
 * @brief Introspector for hosts with no reachable component tree
 */
class UnsupportedIntrospector : public IHostTreeIntrospector {
public:
  explicit UnsupportedIntrospector(std::string reason = "host component tree is not exposed")
      : fReason(std::move(reason)) {}

  bool IsSupported() const override { return false; }
  Util::Result<HostTreeSnapshot> IntrospectTree() override;

private:
  std::string fReason;
};

/**
 * @brief State of one component as read from the host runtime
 */
struct HostComponentState {
  ComponentId id = kSessionComponentId;
  std::optional<ComponentId> parent_id;
  std::shared_ptr<void> instance;
  ComponentTypeInfo type;
};

/**
 * @brief Surface of the host component runtime the introspector reads
 */
class IHostRuntime {
public:
  virtual ~IHostRuntime() = default;

  /// Version string of the runtime internals
  virtual std::string GetInternalsVersion() const = 0;

  /// Whether the runtime exposes its component table at all
  virtual bool ExposesComponentTree() const = 0;

  /// Current component table; may throw if the internals changed shape
  virtual std::vector<HostComponentState> ReadComponentStates() = 0;
};

/**
 * @brief Adapts an IHostRuntime to IHostTreeIntrospector
 *
 * Support is probed once, on first use, and cached: the runtime must expose
 * its tree and, if a list of known internals versions is given, report one
 * of them.
 */
class HostRuntimeIntrospector : public IHostTreeIntrospector {
public:
  explicit HostRuntimeIntrospector(std::shared_ptr<IHostRuntime> runtime,
                                   std::vector<std::string> knownVersions = {});

  bool IsSupported() const override;
  Util::Result<HostTreeSnapshot> IntrospectTree() override;

private:
  bool ProbeSupport() const;

  std::shared_ptr<IHostRuntime> fRuntime;
  std::vector<std::string> fKnownVersions;

  mutable std::once_flag fProbeOnce;
  mutable bool fSupported = false;
};

} // namespace Tracking
} // namespace SHADE

#endif // SHADE_TRACKING_HOST_TREE_INTROSPECTOR_HPP
