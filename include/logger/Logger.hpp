#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <thread>
#include <atomic>
#include <condition_variable>

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

/**
 * @brief Logging settings, one block per process (server or client)
 */
struct LoggingSettings {
    bool enabled = true;
    LogLevel level = LogLevel::Info;
    std::string directory = "logs";
    std::string filePrefix = "conveyord";
};

class Logger {
public:
    static void init();

    static void init(const LoggingSettings &settings);

    static void shutdown();

    static void setLevel(LogLevel level);

    static LogLevel getLevel();

    static void logDebug(const std::string &message);

    static void logInfo(const std::string &message);

    static void logWarning(const std::string &message);

    static void logError(const std::string &message);

    /**
     * @brief Parse "DEBUG", "INFO", "WARNING" or "ERROR" (case-insensitive)
     * @return false if the name is not a known level
     */
    static bool parseLevel(const std::string &name, LogLevel &level);

    static std::string levelToString(LogLevel level);

private:
    static std::ofstream logFile_;
    static std::mutex logMutex_;
    static std::string currentLogPath_;
    static std::atomic<size_t> currentLogSize_;
    static std::atomic<bool> rotationEnabled_;
    static std::atomic<int> minLevel_;
    static std::atomic<bool> consoleEnabled_;
    static std::thread cleanupThread_;
    static std::atomic<bool> shutdownRequested_;
    static std::mutex cleanupMutex_;
    static std::condition_variable cleanupCondition_;
    static LoggingSettings settings_;

    static void log(LogLevel level, const std::string &message);

    static void rotateLogFile();

    static void startCleanupThread();

    static void cleanupOldLogs();

    static std::string currentTimestamp();

    static std::string generateLogFilename();
};
