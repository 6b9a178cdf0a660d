#ifndef SHADE_CORE_ERROR_CODE_HPP
#define SHADE_CORE_ERROR_CODE_HPP

#include <cstdint>
#include <string>

namespace SHADE {

/**
 * @brief Error codes for inspector responses
 */
enum class ErrorCode : uint16_t {
  Success = 0,

  // Configuration errors (100-199)
  InvalidConfiguration = 100,
  ConfigurationNotFound = 101,

  // Request errors (200-299)
  UnknownCommand = 200,
  InvalidRequest = 201,
  MissingArgument = 202,
  SessionNotFound = 203,
  ComponentNotFound = 204,

  // Introspection errors (300-399)
  IntrospectionUnsupported = 300,
  IntrospectionFailed = 301,

  // Communication errors (400-499)
  CommunicationError = 400,
  Timeout = 401,
  HostDisconnected = 402,

  // Internal errors (500-599)
  InternalError = 500,
  SerializationError = 501,

  // Unknown error
  Unknown = 999
};

/**
 * @brief Convert ErrorCode to string for logging and responses
 */
inline std::string ErrorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Success";
  case ErrorCode::InvalidConfiguration:
    return "InvalidConfiguration";
  case ErrorCode::ConfigurationNotFound:
    return "ConfigurationNotFound";
  case ErrorCode::UnknownCommand:
    return "UnknownCommand";
  case ErrorCode::InvalidRequest:
    return "InvalidRequest";
  case ErrorCode::MissingArgument:
    return "MissingArgument";
  case ErrorCode::SessionNotFound:
    return "SessionNotFound";
  case ErrorCode::ComponentNotFound:
    return "ComponentNotFound";
  case ErrorCode::IntrospectionUnsupported:
    return "IntrospectionUnsupported";
  case ErrorCode::IntrospectionFailed:
    return "IntrospectionFailed";
  case ErrorCode::CommunicationError:
    return "CommunicationError";
  case ErrorCode::Timeout:
    return "Timeout";
  case ErrorCode::HostDisconnected:
    return "HostDisconnected";
  case ErrorCode::InternalError:
    return "InternalError";
  case ErrorCode::SerializationError:
    return "SerializationError";
  case ErrorCode::Unknown:
    return "Unknown";
  default:
    return "Unknown(" + std::to_string(static_cast<uint16_t>(code)) + ")";
  }
}

} // namespace SHADE

#endif // SHADE_CORE_ERROR_CODE_HPP
