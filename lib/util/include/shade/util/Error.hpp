#pragma once

#include <string>
#include <variant>
#include <vector>
#include <optional>
#include <chrono>

namespace SHADE::Util {

/**
 * @brief Error information structure for fallible library operations
 *
 * Contains error code, descriptive message, timestamp, and optional context.
 * Includes stack trace information in debug builds for debugging assistance.
 */
struct Error {
    /**
     * @brief Error codes for all possible error conditions
     */
    enum Code {
        SUCCESS = 0,                // Operation successful
        INTROSPECTION_UNSUPPORTED,  // Host internals are not reachable
        INTROSPECTION_FAILED,       // Host tree read failed for this pass
        INVALID_CONFIG,             // Configuration parameters are invalid
        CONFIG_NOT_FOUND,           // Configuration file missing or unreadable
    };

    Code code;                      // Error code
    std::string message;            // Human-readable error description
    std::string timestamp;          // Human-readable timestamp (e.g., "2025-07-25 14:30:21")
    std::optional<int> system_errno; // System errno for system call failures

#ifndef NDEBUG
    std::vector<std::string> stack_trace; // Stack trace in debug builds only
#endif

    /**
     * @brief Construct error with current timestamp
     * @param c Error code
     * @param msg Error message
     * @param errno_val System errno value (0 if not applicable)
     */
    Error(Code c, const std::string& msg, int errno_val = 0);

    /**
     * @brief Get current timestamp in human-readable format
     * @return Formatted timestamp string (YYYY-MM-DD HH:MM:SS)
     */
    static std::string getCurrentTimestamp();

    /**
     * @brief Name of an error code for logs and inspector responses
     */
    static const char* codeToString(Code c);

private:
    void captureStackTrace();
};

/**
 * @brief Result type for error handling without exceptions
 *
 * Contains either a successful result of type T or an Error.
 */
template<typename T>
using Result = std::variant<T, Error>;

/**
 * @brief Helper type for void returns that can fail
 */
using Status = Result<std::monostate>;

/**
 * @brief Check if Result contains a successful value
 */
template<typename T>
bool isOk(const Result<T>& result) {
    return std::holds_alternative<T>(result);
}

/**
 * @brief Extract successful value from Result
 * @warning Only call if isOk(result) returns true
 */
template<typename T>
const T& getValue(const Result<T>& result) {
    return std::get<T>(result);
}

/**
 * @brief Move the successful value out of a Result
 * @warning Only call if isOk(result) returns true
 */
template<typename T>
T takeValue(Result<T>&& result) {
    return std::get<T>(std::move(result));
}

/**
 * @brief Extract error from Result
 * @warning Only call if isOk(result) returns false
 */
template<typename T>
const Error& getError(const Result<T>& result) {
    return std::get<Error>(result);
}

/**
 * @brief Create successful Result
 */
template<typename T>
Result<T> Ok(T&& value) {
    return Result<T>{std::forward<T>(value)};
}

/**
 * @brief Create error Result
 */
template<typename T>
Result<T> Err(Error&& error) {
    return Result<T>{std::forward<Error>(error)};
}

} // namespace SHADE::Util
