#ifndef SHADE_INSPECTOR_INSPECTOR_QUERY_SERVICE_HPP
#define SHADE_INSPECTOR_INSPECTOR_QUERY_SERVICE_HPP

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "shade/inspector/QueryCommand.hpp"
#include "shade/runtime/SessionManager.hpp"
#include "shade/timeline/ITimelineRecorder.hpp"

namespace SHADE {
namespace Inspector {

/**
 * @brief JSON query surface for external inspectors
 *
 * Request:
 *   {"command": "GetEvents", "request_id": 7, "session": "circuit-1", ...}
 *
 * Response:
 *   {"request_id": 7, "success": true, "error_code": "Success",
 *    "message": "", "payload": [...]}
 *
 * Only StartRecording, StopRecording, ClearEvents and SetMaxEvents change
 * state. Registry commands take the session from "session", or the only
 * open session when there is exactly one.
 *
 * Arguments:
 *   GetComponent, GetEventsForComponent, GetSubtree: "component_id"
 *   GetEventsSince: "after_id"
 *   GetEventsInRange: "start_ms", "end_ms"
 *   SetMaxEvents: "max_events"
 */
class InspectorQueryService {
public:
  InspectorQueryService(std::shared_ptr<Runtime::SessionManager> sessions,
                        std::shared_ptr<Timeline::ITimelineRecorder> recorder);

  /// Never throws; failures become error responses
  QueryResponse Handle(const nlohmann::json &request);

  /// Parse, handle and serialize one wire message
  std::string HandleRaw(const std::string &message);

private:
  QueryResponse Dispatch(QueryCommand command, uint64_t requestId,
                         const nlohmann::json &request);
  QueryResponse HandleRegistryQuery(QueryCommand command, uint64_t requestId,
                                    const nlohmann::json &request);
  std::shared_ptr<Runtime::Session> ResolveSession(const nlohmann::json &request,
                                                   std::string &error) const;

  std::shared_ptr<Runtime::SessionManager> fSessions;
  std::shared_ptr<Timeline::ITimelineRecorder> fRecorder;
};

} // namespace Inspector
} // namespace SHADE

#endif // SHADE_INSPECTOR_INSPECTOR_QUERY_SERVICE_HPP
