#include "shade/util/Logger.hpp"

#include <cerrno>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>

namespace SHADE::Util {

std::mutex Logger::configMutex;
std::string Logger::logDirectory;
LogLevel Logger::globalLogLevel = LogLevel::INFO;

std::string SubsystemToString(Subsystem subsystem) {
    switch (subsystem) {
        case Subsystem::Tracking: return "Tracking";
        case Subsystem::Timeline: return "Timeline";
        case Subsystem::Runtime: return "Runtime";
        case Subsystem::Inspector: return "Inspector";
        case Subsystem::Config: return "Config";
        case Subsystem::Host: return "Host";
        default: return "Unknown";
    }
}

std::string LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::shared_ptr<Logger> Logger::GetLogger(Subsystem subsystem) {
    static std::map<Subsystem, std::shared_ptr<Logger>> loggers;
    static std::mutex loggerMutex;

    std::lock_guard<std::mutex> lock(loggerMutex);

    auto it = loggers.find(subsystem);
    if (it != loggers.end()) {
        return it->second;
    }

    auto logger = std::shared_ptr<Logger>(new Logger(subsystem));
    loggers[subsystem] = logger;
    return logger;
}

bool Logger::Initialize(const std::string& logDir, LogLevel level) {
    std::lock_guard<std::mutex> lock(configMutex);
    logDirectory = logDir;
    globalLogLevel = level;

    if (logDir.empty()) {
        return true;
    }

    // Create log directory if it doesn't exist
    if (mkdir(logDir.c_str(), 0755) != 0 && errno != EEXIST) {
        std::cerr << "Failed to create log directory: " << logDir << std::endl;
        logDirectory.clear();
        return false;
    }
    return true;
}

void Logger::SetGlobalLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(configMutex);
    globalLogLevel = level;
}

LogLevel Logger::GetGlobalLogLevel() {
    std::lock_guard<std::mutex> lock(configMutex);
    return globalLogLevel;
}

Logger::Logger(Subsystem subsystem)
    : subsystem(subsystem), currentLevel(GetGlobalLogLevel()) {
}

Logger::~Logger() {
    if (logFile.is_open()) {
        logFile << "[" << GetTimestamp() << "] [INFO] [" << SubsystemToString(subsystem)
                << "] === Logging session ended ===" << std::endl;
        logFile.close();
    }
}

void Logger::Debug(const std::string& message) {
    WriteLog(LogLevel::DEBUG, message);
}

void Logger::Info(const std::string& message) {
    WriteLog(LogLevel::INFO, message);
}

void Logger::Warning(const std::string& message) {
    WriteLog(LogLevel::WARNING, message);
}

void Logger::Error(const std::string& message) {
    WriteLog(LogLevel::ERROR, message);
}

void Logger::SetLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(logMutex);
    currentLevel = level;
}

LogLevel Logger::GetLogLevel() const {
    std::lock_guard<std::mutex> lock(logMutex);
    return currentLevel;
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.flush();
    }
    std::clog.flush();
}

void Logger::OpenFileSinkLocked() {
    if (fileSinkTried) {
        return;
    }

    std::string dir;
    {
        std::lock_guard<std::mutex> lock(configMutex);
        dir = logDirectory;
    }
    if (dir.empty()) {
        return;
    }

    fileSinkTried = true;
    std::string path = dir + "/" + SubsystemToString(subsystem) + ".log";
    logFile.open(path, std::ios::out | std::ios::app);
    if (!logFile.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        return;
    }

    // Write session start marker
    logFile << "[" << GetTimestamp() << "] [INFO] [" << SubsystemToString(subsystem)
            << "] === Logging session started ===" << std::endl;
}

void Logger::WriteLog(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (level < currentLevel) {
        return;
    }

    OpenFileSinkLocked();

    std::string logEntry = "[" + GetTimestamp() + "] [" + LogLevelToString(level) + "] [" +
                           SubsystemToString(subsystem) + "] " + message;

    if (logFile.is_open()) {
        logFile << logEntry << std::endl;
    } else if (level != LogLevel::ERROR) {
        std::clog << logEntry << std::endl;
    }

    // Also write to console for ERROR level
    if (level == LogLevel::ERROR) {
        std::cerr << logEntry << std::endl;
    }
}

std::string Logger::GetTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now{};
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

} // namespace SHADE::Util
