#pragma once

#include <cstdio>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace SHADE::Util {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

enum class Subsystem {
    Tracking,
    Timeline,
    Runtime,
    Inspector,
    Config,
    Host
};

std::string SubsystemToString(Subsystem subsystem);
std::string LogLevelToString(LogLevel level);

class Logger {
public:
    // Get logger instance for subsystem
    static std::shared_ptr<Logger> GetLogger(Subsystem subsystem);

    // Enable file sinks under logDir; an empty logDir keeps console output
    static bool Initialize(const std::string& logDir, LogLevel level = LogLevel::INFO);

    // Global threshold applied to loggers created afterwards
    static void SetGlobalLogLevel(LogLevel level);
    static LogLevel GetGlobalLogLevel();

    // Log methods
    void Debug(const std::string& message);
    void Info(const std::string& message);
    void Warning(const std::string& message);
    void Error(const std::string& message);

    // Log with format
    template<typename... Args>
    void Debug(const char* format, Args&&... args);

    template<typename... Args>
    void Info(const char* format, Args&&... args);

    template<typename... Args>
    void Warning(const char* format, Args&&... args);

    template<typename... Args>
    void Error(const char* format, Args&&... args);

    // Set log level
    void SetLogLevel(LogLevel level);
    LogLevel GetLogLevel() const;

    // Flush logs
    void Flush();

    // Destructor (public for shared_ptr)
    ~Logger();

private:
    explicit Logger(Subsystem subsystem);

    void WriteLog(LogLevel level, const std::string& message);
    void OpenFileSinkLocked();
    std::string GetTimestamp() const;

    template<typename... Args>
    static std::string Format(const char* format, Args&&... args);

    Subsystem subsystem;
    std::ofstream logFile;
    bool fileSinkTried = false;
    LogLevel currentLevel;
    mutable std::mutex logMutex;

    static std::mutex configMutex;
    static std::string logDirectory;
    static LogLevel globalLogLevel;
};

// Template implementations
template<typename... Args>
std::string Logger::Format(const char* format, Args&&... args) {
    if constexpr (sizeof...(Args) == 0) {
        return std::string(format);
    } else {
        // Simple sprintf-like implementation
        char buffer[1024];
        std::snprintf(buffer, sizeof(buffer), format, args...);
        return std::string(buffer);
    }
}

template<typename... Args>
void Logger::Debug(const char* format, Args&&... args) {
    Debug(Format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void Logger::Info(const char* format, Args&&... args) {
    Info(Format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void Logger::Warning(const char* format, Args&&... args) {
    Warning(Format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void Logger::Error(const char* format, Args&&... args) {
    Error(Format(format, std::forward<Args>(args)...));
}

} // namespace SHADE::Util
