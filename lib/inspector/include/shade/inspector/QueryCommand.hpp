#ifndef SHADE_INSPECTOR_QUERY_COMMAND_HPP
#define SHADE_INSPECTOR_QUERY_COMMAND_HPP

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "shade/core/ErrorCode.hpp"

namespace SHADE {
namespace Inspector {

/**
 * @brief Commands accepted by the inspector query surface
 */
enum class QueryCommand : uint8_t {
  // Recording controls
  StartRecording = 0,
  StopRecording = 1,
  ClearEvents = 2,
  SetMaxEvents = 3,

  // Recorder queries
  GetState = 10,
  GetEvents = 11,
  GetEventsSince = 12,
  GetEventsInRange = 13,
  GetEventsForComponent = 14,
  GetBatches = 15,
  GetRankedComponents = 16,

  // Registry queries
  GetAllComponents = 20,
  GetComponent = 21,
  GetCounts = 22,
  GetSubtree = 23,
  GetSessions = 24,

  // Utility commands
  Ping = 30
};

inline std::string QueryCommandToString(QueryCommand command) {
  switch (command) {
  case QueryCommand::StartRecording:
    return "StartRecording";
  case QueryCommand::StopRecording:
    return "StopRecording";
  case QueryCommand::ClearEvents:
    return "ClearEvents";
  case QueryCommand::SetMaxEvents:
    return "SetMaxEvents";
  case QueryCommand::GetState:
    return "GetState";
  case QueryCommand::GetEvents:
    return "GetEvents";
  case QueryCommand::GetEventsSince:
    return "GetEventsSince";
  case QueryCommand::GetEventsInRange:
    return "GetEventsInRange";
  case QueryCommand::GetEventsForComponent:
    return "GetEventsForComponent";
  case QueryCommand::GetBatches:
    return "GetBatches";
  case QueryCommand::GetRankedComponents:
    return "GetRankedComponents";
  case QueryCommand::GetAllComponents:
    return "GetAllComponents";
  case QueryCommand::GetComponent:
    return "GetComponent";
  case QueryCommand::GetCounts:
    return "GetCounts";
  case QueryCommand::GetSubtree:
    return "GetSubtree";
  case QueryCommand::GetSessions:
    return "GetSessions";
  case QueryCommand::Ping:
    return "Ping";
  default:
    return "Unknown";
  }
}

std::optional<QueryCommand> QueryCommandFromString(const std::string &name);

/**
 * @brief Response envelope returned for every request
 */
struct QueryResponse {
  uint64_t request_id = 0;
  bool success = true;
  ErrorCode error_code = ErrorCode::Success;
  std::string message;
  nlohmann::json payload;

  /// Create a success response
  static QueryResponse Success(uint64_t id, nlohmann::json payload,
                               const std::string &msg = "") {
    QueryResponse resp;
    resp.request_id = id;
    resp.payload = std::move(payload);
    resp.message = msg;
    return resp;
  }

  /// Create an error response
  static QueryResponse Error(uint64_t id, ErrorCode code,
                             const std::string &msg) {
    QueryResponse resp;
    resp.request_id = id;
    resp.success = false;
    resp.error_code = code;
    resp.message = msg;
    return resp;
  }

  nlohmann::json ToJson() const {
    return {{"request_id", request_id},
            {"success", success},
            {"error_code", ErrorCodeToString(error_code)},
            {"message", message},
            {"payload", payload}};
  }
};

} // namespace Inspector
} // namespace SHADE

#endif // SHADE_INSPECTOR_QUERY_COMMAND_HPP
