#include "shade/runtime/Session.hpp"

#include "shade/util/Logger.hpp"

namespace SHADE {
namespace Runtime {

using Util::Logger;
using Util::Subsystem;

namespace {

const char *const kSessionSubject = "Session";

} // namespace

Session::Session(std::string id,
                 std::shared_ptr<Tracking::IHostTreeIntrospector> introspector,
                 std::shared_ptr<Timeline::ITimelineRecorder> recorder,
                 std::chrono::milliseconds reconcileInterval)
    : fId(std::move(id)), fRecorder(std::move(recorder)),
      fRegistry(std::move(introspector), reconcileInterval) {}

void Session::Open() {
  if (fOpen.exchange(true)) {
    return;
  }
  fOpenedAtMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::system_clock::now().time_since_epoch())
                    .count();

  Timeline::EventOptions options;
  options.metadata["session"] = fId;
  fRecorder->RecordEvent(kSessionComponentId, kSessionSubject,
                         EventKind::SessionOpened, options);

  Logger::GetLogger(Subsystem::Runtime)
      ->Info("Session '%s' opened (introspection %s)", fId.c_str(),
             fRegistry.IsIntrospectionSupported() ? "supported" : "unsupported");
}

void Session::Close() {
  if (!fOpen.exchange(false)) {
    return;
  }

  Timeline::EventOptions options;
  options.metadata["session"] = fId;
  fRecorder->RecordEvent(kSessionComponentId, kSessionSubject,
                         EventKind::SessionClosed, options);

  fRegistry.Clear();
  Logger::GetLogger(Subsystem::Runtime)->Info("Session '%s' closed", fId.c_str());
}

} // namespace Runtime
} // namespace SHADE
