/**
 * @file test_utils.hpp
 * @brief Utilities shared by the integration tests
 *
 * Provides event-based waiting and an in-process stand-in for the host
 * component runtime.
 */

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "shade/tracking/HostTreeIntrospector.hpp"

namespace SHADE {
namespace test {

/**
 * @brief Wait for a condition with timeout
 * @param condition Function returning true when condition is met
 * @param timeout_ms Maximum wait time in milliseconds
 * @param poll_interval_ms Polling interval in milliseconds
 * @return true if condition was met, false if timeout
 */
inline bool WaitForCondition(std::function<bool()> condition,
                             int timeout_ms = 1000,
                             int poll_interval_ms = 5) {
  using namespace std::chrono;
  auto start = steady_clock::now();
  auto timeout = milliseconds(timeout_ms);

  while (duration_cast<milliseconds>(steady_clock::now() - start) < timeout) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(milliseconds(poll_interval_ms));
  }
  return condition();
}

struct HostObject {
  explicit HostObject(std::string n) : name(std::move(n)) {}
  std::string name;
};

/**
 * @brief Thread-safe component table the tests mutate like a renderer would
 */
class SimulatedHostRuntime : public Tracking::IHostRuntime {
public:
  explicit SimulatedHostRuntime(std::string version = "8.0")
      : version_(std::move(version)) {}

  std::string GetInternalsVersion() const override { return version_; }
  bool ExposesComponentTree() const override { return true; }

  std::vector<Tracking::HostComponentState> ReadComponentStates() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failReads_) {
      throw std::runtime_error("component table changed shape");
    }
    std::vector<Tracking::HostComponentState> states;
    for (const auto &kv : table_) {
      states.push_back(kv.second);
    }
    return states;
  }

  std::shared_ptr<void> Mount(ComponentId id, std::optional<ComponentId> parent,
                              const std::string &fullName,
                              bool exposeInstance = true) {
    auto instance = std::make_shared<HostObject>(fullName);
    Tracking::HostComponentState state;
    state.id = id;
    state.parent_id = parent;
    state.type = ComponentTypeInfo::FromFullName(fullName);
    if (exposeInstance) {
      state.instance = instance;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    table_[id] = state;
    return instance;
  }

  void Unmount(ComponentId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    table_.erase(id);
  }

  void SetFailReads(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failReads_ = fail;
  }

private:
  const std::string version_;
  std::mutex mutex_;
  std::map<ComponentId, Tracking::HostComponentState> table_;
  bool failReads_ = false;
};

} // namespace test
} // namespace SHADE
