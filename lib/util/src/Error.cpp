/**
 * @file Error.cpp
 * @brief Implementation of Error handling and Result pattern
 */

#include "shade/util/Error.hpp"
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

#ifndef NDEBUG
#include <execinfo.h>  // For backtrace (Linux/macOS)
#include <cstdlib>
#endif

namespace SHADE::Util {

Error::Error(Code c, const std::string& msg, int errno_val)
    : code(c), message(msg), timestamp(getCurrentTimestamp()) {

    if (errno_val != 0) {
        system_errno = errno_val;
        message += " (errno: " + std::to_string(errno_val) + " - " + std::strerror(errno_val) + ")";
    }

#ifndef NDEBUG
    captureStackTrace();
#endif
}

std::string Error::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm tm_now{};
    localtime_r(&time_t_now, &tm_now);

    // Format: "YYYY-MM-DD HH:MM:SS"
    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

const char* Error::codeToString(Code c) {
    switch (c) {
        case SUCCESS: return "SUCCESS";
        case INTROSPECTION_UNSUPPORTED: return "INTROSPECTION_UNSUPPORTED";
        case INTROSPECTION_FAILED: return "INTROSPECTION_FAILED";
        case INVALID_CONFIG: return "INVALID_CONFIG";
        case CONFIG_NOT_FOUND: return "CONFIG_NOT_FOUND";
    }
    return "UNKNOWN";
}

void Error::captureStackTrace() {
#ifndef NDEBUG
    constexpr int MAX_FRAMES = 16;
    void* buffer[MAX_FRAMES];

    int frame_count = backtrace(buffer, MAX_FRAMES);
    if (frame_count > 0) {
        char** symbols = backtrace_symbols(buffer, frame_count);
        if (symbols) {
            stack_trace.reserve(frame_count);
            for (int i = 0; i < frame_count; ++i) {
                stack_trace.emplace_back(symbols[i]);
            }
            std::free(symbols);
        }
    }

    if (stack_trace.empty()) {
        stack_trace.emplace_back("Stack trace capture not available");
    }
#endif
}

} // namespace SHADE::Util
