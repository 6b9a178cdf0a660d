#include "shade/runtime/SessionManager.hpp"

#include "shade/util/Logger.hpp"

namespace SHADE {
namespace Runtime {

using Util::Logger;
using Util::Subsystem;

SessionManager::SessionManager(
    std::shared_ptr<Timeline::ITimelineRecorder> recorder,
    std::chrono::milliseconds reconcileInterval)
    : fRecorder(std::move(recorder)), fReconcileInterval(reconcileInterval) {}

SessionManager::~SessionManager() { CloseAll(); }

std::shared_ptr<Session> SessionManager::OpenSession(
    const std::string &id,
    std::shared_ptr<Tracking::IHostTreeIntrospector> introspector) {
  std::shared_ptr<Session> session;
  {
    std::lock_guard<std::mutex> lock(fMutex);
    auto it = fSessions.find(id);
    if (it != fSessions.end()) {
      Logger::GetLogger(Subsystem::Runtime)
          ->Warning("Session '%s' already open", id.c_str());
      return it->second;
    }
    session = std::make_shared<Session>(id, std::move(introspector), fRecorder,
                                        fReconcileInterval);
    fSessions.emplace(id, session);
  }
  session->Open();
  return session;
}

bool SessionManager::CloseSession(const std::string &id) {
  std::shared_ptr<Session> session;
  {
    std::lock_guard<std::mutex> lock(fMutex);
    auto it = fSessions.find(id);
    if (it == fSessions.end()) {
      return false;
    }
    session = it->second;
    fSessions.erase(it);
  }
  session->Close();
  return true;
}

void SessionManager::CloseAll() {
  std::map<std::string, std::shared_ptr<Session>> sessions;
  {
    std::lock_guard<std::mutex> lock(fMutex);
    sessions.swap(fSessions);
  }
  for (auto &kv : sessions) {
    kv.second->Close();
  }
}

std::shared_ptr<Session> SessionManager::GetSession(const std::string &id) const {
  std::lock_guard<std::mutex> lock(fMutex);
  auto it = fSessions.find(id);
  return it == fSessions.end() ? nullptr : it->second;
}

std::vector<std::string> SessionManager::GetSessionIds() const {
  std::lock_guard<std::mutex> lock(fMutex);
  std::vector<std::string> ids;
  ids.reserve(fSessions.size());
  for (const auto &kv : fSessions) {
    ids.push_back(kv.first);
  }
  return ids;
}

size_t SessionManager::GetSessionCount() const {
  std::lock_guard<std::mutex> lock(fMutex);
  return fSessions.size();
}

} // namespace Runtime
} // namespace SHADE
