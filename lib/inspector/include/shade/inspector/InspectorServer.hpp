#ifndef SHADE_INSPECTOR_INSPECTOR_SERVER_HPP
#define SHADE_INSPECTOR_INSPECTOR_SERVER_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include <zmq.hpp>

#include "shade/core/ShadeConfig.hpp"
#include "shade/inspector/InspectorQueryService.hpp"

namespace SHADE {
namespace Inspector {

/**
 * @brief ZeroMQ REP endpoint serving InspectorQueryService
 *
 * One listener thread polls the socket with receive_timeout_ms so Stop()
 * returns promptly. After max_consecutive_failures transport errors in a
 * row the listener gives up and the server reports not running.
 *
 * Usage:
 *   InspectorServer server(service, config.inspector);
 *   if (server.Start()) {
 *       ... host runs ...
 *       server.Stop();
 *   }
 */
class InspectorServer {
public:
  InspectorServer(std::shared_ptr<InspectorQueryService> service,
                  InspectorConfig config);
  ~InspectorServer();

  InspectorServer(const InspectorServer &) = delete;
  InspectorServer &operator=(const InspectorServer &) = delete;

  /// Bind the endpoint and start the listener; false if binding failed
  bool Start();
  void Stop();
  bool IsRunning() const { return fRunning.load(); }

  /// Endpoint actually bound (resolves a wildcard port), empty if stopped
  std::string GetBoundEndpoint() const { return fBoundEndpoint; }

  uint64_t GetHandledCount() const { return fHandled.load(); }

private:
  void ListenerLoop();

  std::shared_ptr<InspectorQueryService> fService;
  const InspectorConfig fConfig;

  std::unique_ptr<zmq::context_t> fContext;
  std::unique_ptr<zmq::socket_t> fSocket;
  std::unique_ptr<std::thread> fListenerThread;
  std::atomic<bool> fRunning{false};
  std::atomic<uint64_t> fHandled{0};
  std::string fBoundEndpoint;
};

} // namespace Inspector
} // namespace SHADE

#endif // SHADE_INSPECTOR_INSPECTOR_SERVER_HPP
