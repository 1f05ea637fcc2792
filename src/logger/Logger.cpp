#include "logger/Logger.hpp"

#include <algorithm>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <vector>
#include <cctype>

namespace fs = std::filesystem;

std::ofstream Logger::logFile_;
std::mutex Logger::logMutex_;
std::string Logger::currentLogPath_;
std::atomic<size_t> Logger::currentLogSize_{0};
std::atomic<bool> Logger::rotationEnabled_{true};
std::atomic<int> Logger::minLevel_{static_cast<int>(LogLevel::Info)};
std::thread Logger::cleanupThread_;
std::atomic<bool> Logger::shutdownRequested_{false};
std::mutex Logger::cleanupMutex_;
std::condition_variable Logger::cleanupCondition_;
LoggingSettings Logger::settings_;

constexpr size_t MAX_LOG_SIZE = 50 * 1024 * 1024; // 50MB
constexpr size_t MAX_LOG_FILES = 10;
constexpr std::chrono::hours LOG_RETENTION{24 * 7}; // 7 days

void Logger::init() {
    init(LoggingSettings{});
}

void Logger::init(const LoggingSettings &settings) {
    {
        std::lock_guard<std::mutex> lock(logMutex_);
        settings_ = settings;
        minLevel_ = static_cast<int>(settings.level);
        rotationEnabled_ = settings.enabled;
        shutdownRequested_ = false;
        if (settings_.enabled) {
            rotateLogFile();
        }
    }

    if (settings_.enabled && !cleanupThread_.joinable()) {
        startCleanupThread();
    }

    logInfo("[Logger] Initialized at level " + levelToString(settings.level) +
            (settings.enabled ? " with auto-rotation (max " + std::to_string(MAX_LOG_SIZE / 1024 / 1024) + "MB)"
                              : " (file output disabled)"));
}

void Logger::shutdown() {
    {
        std::lock_guard<std::mutex> lock(cleanupMutex_);
        shutdownRequested_ = true;
    }
    cleanupCondition_.notify_all();
    if (cleanupThread_.joinable()) {
        cleanupThread_.join();
    }
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void Logger::setLevel(LogLevel level) {
    minLevel_ = static_cast<int>(level);
}

LogLevel Logger::getLevel() {
    return static_cast<LogLevel>(minLevel_.load());
}

void Logger::logDebug(const std::string &message) {
    log(LogLevel::Debug, message);
}

void Logger::logInfo(const std::string &message) {
    log(LogLevel::Info, message);
}

void Logger::logWarning(const std::string &message) {
    log(LogLevel::Warning, message);
}

void Logger::logError(const std::string &message) {
    log(LogLevel::Error, message);
}

bool Logger::parseLevel(const std::string &name, LogLevel &level) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") {
        level = LogLevel::Debug;
    } else if (upper == "INFO") {
        level = LogLevel::Info;
    } else if (upper == "WARNING" || upper == "WARN") {
        level = LogLevel::Warning;
    } else if (upper == "ERROR") {
        level = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARNING";
        case LogLevel::Error:
            return "ERROR";
        default:
            return "UNKNOWN";
    }
}

void Logger::log(LogLevel level, const std::string &message) {
    if (static_cast<int>(level) < minLevel_) {
        return;
    }

    if (message.empty() || message.find_first_not_of(" \t\r\n") == std::string::npos) {
        return;
    }

    std::string timestamp = currentTimestamp();
    std::string formatted = "[" + levelToString(level) + "] [" + timestamp + "] " + message;

    std::lock_guard<std::mutex> lock(logMutex_);
    if (level == LogLevel::Error) {
        std::cerr << formatted << std::endl;
    } else {
        std::cout << formatted << std::endl;
    }

    if (rotationEnabled_ && currentLogSize_ > MAX_LOG_SIZE) {
        rotateLogFile();
    }

    if (logFile_.is_open()) {
        logFile_ << formatted << std::endl;
        currentLogSize_ += formatted.length() + 1;
    }
}

void Logger::rotateLogFile() {
    if (logFile_.is_open()) {
        logFile_.close();
    }

    currentLogPath_ = generateLogFilename();
    logFile_.open(currentLogPath_, std::ios::out | std::ios::trunc);
    currentLogSize_ = 0;

    if (!logFile_.is_open()) {
        std::cerr << "[Logger] ERROR: Cannot open log file: " << currentLogPath_ << std::endl;
    }
}

void Logger::startCleanupThread() {
    cleanupThread_ = std::thread([]() {
        std::unique_lock<std::mutex> lock(cleanupMutex_);
        while (!shutdownRequested_) {
            lock.unlock();
            cleanupOldLogs();
            lock.lock();
            cleanupCondition_.wait_for(lock, std::chrono::hours(1), [] { return shutdownRequested_.load(); });
        }
    });
}

void Logger::cleanupOldLogs() {
    try {
        std::string logsFolder = settings_.directory;
        if (!fs::exists(logsFolder)) return;

        auto cutoffTime = std::chrono::system_clock::now() - LOG_RETENTION;
        std::vector<fs::path> logFiles;

        for (const auto &entry: fs::directory_iterator(logsFolder)) {
            if (entry.path().extension() == ".log") {
                auto writeTime = fs::last_write_time(entry);
                auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                        writeTime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());

                if (sctp < cutoffTime) {
                    fs::remove(entry);
                } else {
                    logFiles.push_back(entry.path());
                }
            }
        }

        if (logFiles.size() > MAX_LOG_FILES) {
            std::sort(logFiles.begin(), logFiles.end(), [](const fs::path &a, const fs::path &b) {
                return fs::last_write_time(a) < fs::last_write_time(b);
            });

            for (size_t i = 0; i < logFiles.size() - MAX_LOG_FILES; ++i) {
                fs::remove(logFiles[i]);
            }
        }
    } catch (const std::exception &e) {
        std::cerr << "[Logger] Cleanup error: " << e.what() << std::endl;
    }
}

std::string Logger::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm localTime{};
    localtime_r(&in_time_t, &localTime);

    std::stringstream ss;
    ss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
       << millis.count();
    return ss.str();
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);

    std::tm localTime{};
    localtime_r(&in_time_t, &localTime);

    std::stringstream ss;
    ss << std::put_time(&localTime, "%Y%m%d_%H%M%S");

    std::string logsFolder = settings_.directory.empty() ? "logs" : settings_.directory;
    std::error_code ec;
    fs::create_directories(logsFolder, ec);
    if (ec) {
        std::cerr << "[Logger] ERROR: Cannot create log directory " << logsFolder << ": " << ec.message()
                  << std::endl;
    }

    return logsFolder + "/" + settings_.filePrefix + "_" + ss.str() + ".log";
}
