#ifndef SHADE_RUNTIME_SESSION_HPP
#define SHADE_RUNTIME_SESSION_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "shade/timeline/ITimelineRecorder.hpp"
#include "shade/tracking/ComponentRegistry.hpp"

namespace SHADE {
namespace Runtime {

/**
 * @brief One connection's isolated component scope
 *
 * Owns the session's registry and shares the process-wide recorder.
 */
class Session {
public:
  Session(std::string id,
          std::shared_ptr<Tracking::IHostTreeIntrospector> introspector,
          std::shared_ptr<Timeline::ITimelineRecorder> recorder,
          std::chrono::milliseconds reconcileInterval);

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  /// Records session-opened; repeated calls are ignored
  void Open();

  /// Records session-closed and clears the registry
  void Close();

  bool IsOpen() const { return fOpen.load(); }

  const std::string &GetId() const { return fId; }
  int64_t GetOpenedAtMs() const { return fOpenedAtMs; }

  Tracking::ComponentRegistry &GetRegistry() { return fRegistry; }
  Timeline::ITimelineRecorder &GetRecorder() { return *fRecorder; }
  std::shared_ptr<Timeline::ITimelineRecorder> GetRecorderPtr() const {
    return fRecorder;
  }

private:
  const std::string fId;
  std::shared_ptr<Timeline::ITimelineRecorder> fRecorder;
  Tracking::ComponentRegistry fRegistry;
  std::atomic<bool> fOpen{false};
  int64_t fOpenedAtMs = 0;
};

} // namespace Runtime
} // namespace SHADE

#endif // SHADE_RUNTIME_SESSION_HPP
