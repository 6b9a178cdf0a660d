#ifndef SHADE_RUNTIME_SESSION_MANAGER_HPP
#define SHADE_RUNTIME_SESSION_MANAGER_HPP

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "shade/runtime/Session.hpp"

namespace SHADE {
namespace Runtime {

/**
 * @brief Thread-safe directory of open sessions
 *
 * The manager's mutex only guards the map; it is never held while calling
 * into a session or its registry.
 */
class SessionManager {
public:
  SessionManager(std::shared_ptr<Timeline::ITimelineRecorder> recorder,
                 std::chrono::milliseconds reconcileInterval =
                     std::chrono::milliseconds(1000));
  ~SessionManager();

  SessionManager(const SessionManager &) = delete;
  SessionManager &operator=(const SessionManager &) = delete;

  /// Open a new session, or return the existing one with that id
  std::shared_ptr<Session>
  OpenSession(const std::string &id,
              std::shared_ptr<Tracking::IHostTreeIntrospector> introspector);

  bool CloseSession(const std::string &id);
  void CloseAll();

  /// nullptr if no such session
  std::shared_ptr<Session> GetSession(const std::string &id) const;

  /// Sorted ids
  std::vector<std::string> GetSessionIds() const;
  size_t GetSessionCount() const;

  std::shared_ptr<Timeline::ITimelineRecorder> GetRecorder() const {
    return fRecorder;
  }

private:
  std::shared_ptr<Timeline::ITimelineRecorder> fRecorder;
  const std::chrono::milliseconds fReconcileInterval;

  mutable std::mutex fMutex;
  std::map<std::string, std::shared_ptr<Session>> fSessions;
};

} // namespace Runtime
} // namespace SHADE

#endif // SHADE_RUNTIME_SESSION_MANAGER_HPP
