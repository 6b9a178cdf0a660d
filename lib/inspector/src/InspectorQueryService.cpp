#include "shade/inspector/InspectorQueryService.hpp"

#include <limits>

#include "shade/inspector/JsonSerialization.hpp"
#include "shade/util/Logger.hpp"

namespace SHADE {
namespace Inspector {

using Util::Logger;
using Util::Subsystem;

namespace {

const QueryCommand kAllCommands[] = {
    QueryCommand::StartRecording,   QueryCommand::StopRecording,
    QueryCommand::ClearEvents,      QueryCommand::SetMaxEvents,
    QueryCommand::GetState,         QueryCommand::GetEvents,
    QueryCommand::GetEventsSince,   QueryCommand::GetEventsInRange,
    QueryCommand::GetEventsForComponent, QueryCommand::GetBatches,
    QueryCommand::GetRankedComponents,   QueryCommand::GetAllComponents,
    QueryCommand::GetComponent,     QueryCommand::GetCounts,
    QueryCommand::GetSubtree,       QueryCommand::GetSessions,
    QueryCommand::Ping};

// Argument readers return false when the key is missing or mistyped.
// Unsigned values beyond int64_t saturate.
bool ReadInteger(const nlohmann::json &request, const char *key, int64_t &out) {
  if (!request.contains(key) || !request.at(key).is_number_integer()) {
    return false;
  }
  const auto &value = request.at(key);
  if (value.is_number_unsigned()) {
    uint64_t raw = value.get<uint64_t>();
    out = raw > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())
              ? std::numeric_limits<int64_t>::max()
              : static_cast<int64_t>(raw);
    return true;
  }
  out = value.get<int64_t>();
  return true;
}

bool ReadNumber(const nlohmann::json &request, const char *key, double &out) {
  if (!request.contains(key) || !request.at(key).is_number()) {
    return false;
  }
  out = request.at(key).get<double>();
  return true;
}

QueryResponse MissingArgument(uint64_t requestId, const char *key) {
  return QueryResponse::Error(requestId, ErrorCode::MissingArgument,
                              std::string("missing or invalid argument '") +
                                  key + "'");
}

} // namespace

std::optional<QueryCommand> QueryCommandFromString(const std::string &name) {
  for (QueryCommand command : kAllCommands) {
    if (QueryCommandToString(command) == name) {
      return command;
    }
  }
  return std::nullopt;
}

InspectorQueryService::InspectorQueryService(
    std::shared_ptr<Runtime::SessionManager> sessions,
    std::shared_ptr<Timeline::ITimelineRecorder> recorder)
    : fSessions(std::move(sessions)), fRecorder(std::move(recorder)) {}

std::string InspectorQueryService::HandleRaw(const std::string &message) {
  nlohmann::json request;
  try {
    request = nlohmann::json::parse(message);
  } catch (const nlohmann::json::parse_error &e) {
    return QueryResponse::Error(0, ErrorCode::InvalidRequest,
                                std::string("malformed JSON: ") + e.what())
        .ToJson()
        .dump();
  }

  QueryResponse response = Handle(request);
  try {
    return response.ToJson().dump();
  } catch (const nlohmann::json::exception &e) {
    // Invalid UTF-8 in a component or callback name
    return QueryResponse::Error(response.request_id,
                                ErrorCode::SerializationError, e.what())
        .ToJson()
        .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  }
}

QueryResponse InspectorQueryService::Handle(const nlohmann::json &request) {
  if (!request.is_object()) {
    return QueryResponse::Error(0, ErrorCode::InvalidRequest,
                                "request must be a JSON object");
  }

  uint64_t requestId = 0;
  int64_t rawId = 0;
  if (ReadInteger(request, "request_id", rawId) && rawId >= 0) {
    requestId = static_cast<uint64_t>(rawId);
  }

  if (!request.contains("command") || !request.at("command").is_string()) {
    return QueryResponse::Error(requestId, ErrorCode::InvalidRequest,
                                "missing 'command'");
  }
  const std::string name = request.at("command").get<std::string>();
  auto command = QueryCommandFromString(name);
  if (!command) {
    return QueryResponse::Error(requestId, ErrorCode::UnknownCommand,
                                "unknown command '" + name + "'");
  }

  try {
    return Dispatch(*command, requestId, request);
  } catch (const std::exception &e) {
    Logger::GetLogger(Subsystem::Inspector)
        ->Error("Command %s failed: %s", name.c_str(), e.what());
    return QueryResponse::Error(requestId, ErrorCode::InternalError, e.what());
  }
}

QueryResponse InspectorQueryService::Dispatch(QueryCommand command,
                                              uint64_t requestId,
                                              const nlohmann::json &request) {
  switch (command) {
  case QueryCommand::StartRecording:
    fRecorder->StartRecording();
    return QueryResponse::Success(requestId, ToJson(fRecorder->GetState()),
                                  "Recording started");

  case QueryCommand::StopRecording:
    fRecorder->StopRecording();
    return QueryResponse::Success(requestId, ToJson(fRecorder->GetState()),
                                  "Recording stopped");

  case QueryCommand::ClearEvents:
    fRecorder->ClearEvents();
    return QueryResponse::Success(requestId, ToJson(fRecorder->GetState()),
                                  "Events cleared");

  case QueryCommand::SetMaxEvents: {
    int64_t requested = 0;
    if (!ReadInteger(request, "max_events", requested) || requested < 0) {
      return MissingArgument(requestId, "max_events");
    }
    size_t applied = fRecorder->SetMaxEvents(static_cast<size_t>(requested));
    return QueryResponse::Success(requestId, {{"max_events", applied}});
  }

  case QueryCommand::GetState:
    return QueryResponse::Success(requestId, ToJson(fRecorder->GetState()));

  case QueryCommand::GetEvents:
    return QueryResponse::Success(requestId, ToJsonArray(fRecorder->GetEvents()));

  case QueryCommand::GetEventsSince: {
    int64_t afterId = 0;
    if (!ReadInteger(request, "after_id", afterId)) {
      return MissingArgument(requestId, "after_id");
    }
    return QueryResponse::Success(requestId,
                                  ToJsonArray(fRecorder->GetEventsSince(afterId)));
  }

  case QueryCommand::GetEventsInRange: {
    double startMs = 0.0;
    double endMs = 0.0;
    if (!ReadNumber(request, "start_ms", startMs)) {
      return MissingArgument(requestId, "start_ms");
    }
    if (!ReadNumber(request, "end_ms", endMs)) {
      return MissingArgument(requestId, "end_ms");
    }
    return QueryResponse::Success(
        requestId, ToJsonArray(fRecorder->GetEventsInRange(startMs, endMs)));
  }

  case QueryCommand::GetEventsForComponent: {
    int64_t componentId = 0;
    if (!ReadInteger(request, "component_id", componentId)) {
      return MissingArgument(requestId, "component_id");
    }
    return QueryResponse::Success(
        requestId, ToJsonArray(fRecorder->GetEventsForComponent(componentId)));
  }

  case QueryCommand::GetBatches:
    return QueryResponse::Success(requestId, ToJsonArray(fRecorder->GetBatches()));

  case QueryCommand::GetRankedComponents:
    return QueryResponse::Success(requestId,
                                  ToJsonArray(fRecorder->GetRankedComponents()));

  case QueryCommand::GetSessions: {
    nlohmann::json sessions = nlohmann::json::array();
    for (const auto &id : fSessions->GetSessionIds()) {
      auto session = fSessions->GetSession(id);
      if (!session) {
        continue;
      }
      sessions.push_back({{"id", id},
                          {"opened_at_ms", session->GetOpenedAtMs()},
                          {"introspection_supported",
                           session->GetRegistry().IsIntrospectionSupported()}});
    }
    return QueryResponse::Success(requestId, sessions);
  }

  case QueryCommand::Ping:
    return QueryResponse::Success(requestId, {{"pong", true}}, "Pong");

  case QueryCommand::GetAllComponents:
  case QueryCommand::GetComponent:
  case QueryCommand::GetCounts:
  case QueryCommand::GetSubtree:
    return HandleRegistryQuery(command, requestId, request);
  }

  return QueryResponse::Error(requestId, ErrorCode::UnknownCommand,
                              "unhandled command");
}

std::shared_ptr<Runtime::Session>
InspectorQueryService::ResolveSession(const nlohmann::json &request,
                                      std::string &error) const {
  if (request.contains("session")) {
    if (!request.at("session").is_string()) {
      error = "'session' must be a string";
      return nullptr;
    }
    std::string id = request.at("session").get<std::string>();
    auto session = fSessions->GetSession(id);
    if (!session) {
      error = "no open session '" + id + "'";
    }
    return session;
  }

  auto ids = fSessions->GetSessionIds();
  if (ids.size() != 1) {
    error = ids.empty() ? "no open session"
                        : "several sessions open; specify 'session'";
    return nullptr;
  }
  auto session = fSessions->GetSession(ids.front());
  if (!session) {
    error = "session closed during lookup";
  }
  return session;
}

QueryResponse
InspectorQueryService::HandleRegistryQuery(QueryCommand command,
                                           uint64_t requestId,
                                           const nlohmann::json &request) {
  std::string error;
  auto session = ResolveSession(request, error);
  if (!session) {
    return QueryResponse::Error(requestId, ErrorCode::SessionNotFound, error);
  }
  auto &registry = session->GetRegistry();

  switch (command) {
  case QueryCommand::GetAllComponents:
    return QueryResponse::Success(requestId,
                                  ToJsonArray(registry.GetAllComponents()));

  case QueryCommand::GetCounts:
    return QueryResponse::Success(requestId, ToJson(registry.GetCounts()));

  case QueryCommand::GetComponent: {
    int64_t componentId = 0;
    if (!ReadInteger(request, "component_id", componentId)) {
      return MissingArgument(requestId, "component_id");
    }
    auto summary = registry.GetComponent(componentId);
    if (!summary) {
      return QueryResponse::Error(requestId, ErrorCode::ComponentNotFound,
                                  "component " + std::to_string(componentId) +
                                      " not found");
    }
    return QueryResponse::Success(requestId, ToJson(*summary));
  }

  case QueryCommand::GetSubtree: {
    int64_t componentId = 0;
    if (!ReadInteger(request, "component_id", componentId)) {
      return MissingArgument(requestId, "component_id");
    }
    auto subtree = registry.GetSubtree(componentId);
    if (subtree.empty()) {
      return QueryResponse::Error(requestId, ErrorCode::ComponentNotFound,
                                  "component " + std::to_string(componentId) +
                                      " not found");
    }
    return QueryResponse::Success(requestId, ToJsonArray(subtree));
  }

  default:
    return QueryResponse::Error(requestId, ErrorCode::UnknownCommand,
                                "not a registry command");
  }
}

} // namespace Inspector
} // namespace SHADE
