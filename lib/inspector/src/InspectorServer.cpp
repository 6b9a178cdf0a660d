#include "shade/inspector/InspectorServer.hpp"

#include "shade/util/Logger.hpp"

namespace SHADE {
namespace Inspector {

using Util::Logger;
using Util::Subsystem;

InspectorServer::InspectorServer(std::shared_ptr<InspectorQueryService> service,
                                 InspectorConfig config)
    : fService(std::move(service)), fConfig(std::move(config)) {}

InspectorServer::~InspectorServer() { Stop(); }

bool InspectorServer::Start() {
  if (fRunning || fListenerThread) {
    return false;
  }
  auto logger = Logger::GetLogger(Subsystem::Inspector);
  if (!fService || fConfig.endpoint.empty()) {
    logger->Error("Inspector server needs a query service and an endpoint");
    return false;
  }

  try {
    fContext = std::make_unique<zmq::context_t>(1);
    fSocket = std::make_unique<zmq::socket_t>(*fContext, ZMQ_REP);
    fSocket->set(zmq::sockopt::rcvtimeo,
                 static_cast<int>(fConfig.receive_timeout_ms));
    fSocket->set(zmq::sockopt::linger, 0);
    fSocket->bind(fConfig.endpoint);
    fBoundEndpoint = fSocket->get(zmq::sockopt::last_endpoint);
  } catch (const zmq::error_t &e) {
    logger->Error("Failed to bind inspector endpoint %s: %s",
                  fConfig.endpoint.c_str(), e.what());
    fSocket.reset();
    fContext.reset();
    return false;
  }

  fRunning = true;
  fListenerThread =
      std::make_unique<std::thread>(&InspectorServer::ListenerLoop, this);
  logger->Info("Inspector listening on %s", fBoundEndpoint.c_str());
  return true;
}

void InspectorServer::Stop() {
  fRunning = false;

  if (fListenerThread && fListenerThread->joinable()) {
    fListenerThread->join();
  }
  fListenerThread.reset();

  if (fSocket) {
    fSocket->close();
    fSocket.reset();
  }
  fContext.reset();
  fBoundEndpoint.clear();
}

void InspectorServer::ListenerLoop() {
  auto logger = Logger::GetLogger(Subsystem::Inspector);
  uint32_t consecutiveFailures = 0;

  while (fRunning) {
    try {
      zmq::message_t request;
      auto received = fSocket->recv(request, zmq::recv_flags::none);
      if (!received) {
        continue; // Timeout
      }

      std::string reply = fService->HandleRaw(request.to_string());
      fSocket->send(zmq::buffer(reply), zmq::send_flags::none);
      fHandled++;
      consecutiveFailures = 0;
    } catch (const zmq::error_t &e) {
      if (e.num() == ETERM) {
        break;
      }
      consecutiveFailures++;
      logger->Warning("Inspector transport error (%u/%u): %s",
                      consecutiveFailures, fConfig.max_consecutive_failures,
                      e.what());
      if (fConfig.max_consecutive_failures > 0 &&
          consecutiveFailures >= fConfig.max_consecutive_failures) {
        logger->Error("Inspector channel unavailable; listener stopped");
        break;
      }
    }
  }
  fRunning = false;
}

} // namespace Inspector
} // namespace SHADE
