#include "shade/tracking/HostTreeIntrospector.hpp"

#include <algorithm>

#include "shade/util/Logger.hpp"

namespace SHADE {
namespace Tracking {

using Util::Error;
using Util::Logger;
using Util::Subsystem;

Util::Result<HostTreeSnapshot> UnsupportedIntrospector::IntrospectTree() {
  return Util::Err<HostTreeSnapshot>(
      Error(Error::INTROSPECTION_UNSUPPORTED, fReason));
}

HostRuntimeIntrospector::HostRuntimeIntrospector(
    std::shared_ptr<IHostRuntime> runtime, std::vector<std::string> knownVersions)
    : fRuntime(std::move(runtime)), fKnownVersions(std::move(knownVersions)) {}

bool HostRuntimeIntrospector::ProbeSupport() const {
  auto logger = Logger::GetLogger(Subsystem::Tracking);
  if (!fRuntime) {
    logger->Warning("No host runtime attached; introspection disabled");
    return false;
  }

  try {
    if (!fRuntime->ExposesComponentTree()) {
      logger->Info("Host runtime does not expose its component tree; "
                   "using direct resolution only");
      return false;
    }

    std::string version = fRuntime->GetInternalsVersion();
    if (!fKnownVersions.empty() &&
        std::find(fKnownVersions.begin(), fKnownVersions.end(), version) ==
            fKnownVersions.end()) {
      logger->Warning("Unknown host internals version '%s'; introspection disabled",
                      version.c_str());
      return false;
    }
    logger->Info("Host tree introspection enabled (internals %s)",
                 version.c_str());
    return true;
  } catch (const std::exception &e) {
    logger->Warning(std::string("Host support probe failed: ") + e.what());
    return false;
  }
}

bool HostRuntimeIntrospector::IsSupported() const {
  std::call_once(fProbeOnce, [this] { fSupported = ProbeSupport(); });
  return fSupported;
}

Util::Result<HostTreeSnapshot> HostRuntimeIntrospector::IntrospectTree() {
  if (!IsSupported()) {
    return Util::Err<HostTreeSnapshot>(Error(
        Error::INTROSPECTION_UNSUPPORTED, "host component tree is not reachable"));
  }

  std::vector<HostComponentState> states;
  try {
    states = fRuntime->ReadComponentStates();
  } catch (const std::exception &e) {
    return Util::Err<HostTreeSnapshot>(Error(
        Error::INTROSPECTION_FAILED,
        std::string("reading host component states failed: ") + e.what()));
  }

  HostTreeSnapshot snapshot;
  for (auto &state : states) {
    HostTreeEntry entry;
    entry.instance = std::move(state.instance);
    entry.parent_id = state.parent_id;
    entry.type = std::move(state.type);
    // A repeated id keeps the last reported state
    snapshot[state.id] = std::move(entry);
  }
  return Util::Ok(std::move(snapshot));
}

} // namespace Tracking
} // namespace SHADE
