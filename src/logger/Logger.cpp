#include "logger/Logger.hpp"

#include <algorithm>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

std::ofstream Logger::logFile_;
std::mutex Logger::logMutex_;
std::string Logger::logsFolder_ = "logs";
std::string Logger::currentLogPath_;
std::atomic<size_t> Logger::currentLogSize_{0};
std::atomic<int> Logger::minLevel_{static_cast<int>(Logger::Level::Info)};

constexpr size_t MAX_LOG_SIZE = 10 * 1024 * 1024; // 10MB
constexpr size_t MAX_LOG_FILES = 10;
constexpr std::chrono::hours LOG_RETENTION{24 * 7}; // 7 days

void Logger::init(const std::string &logsFolder) {
    {
        std::lock_guard<std::mutex> lock(logMutex_);
        logsFolder_ = logsFolder;
        cleanupOldLogs();
        rotateLogFile();
    }
    logInfo("[Logger] Writing to " + currentLogPath_ + " (max " + std::to_string(MAX_LOG_SIZE / 1024 / 1024) + "MB)");
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void Logger::setLevel(Level level) {
    minLevel_ = static_cast<int>(level);
}

Logger::Level Logger::level() {
    return static_cast<Level>(minLevel_.load());
}

void Logger::logDebug(const std::string &message) {
    log(Level::Debug, message);
}

void Logger::logInfo(const std::string &message) {
    log(Level::Info, message);
}

void Logger::logWarning(const std::string &message) {
    log(Level::Warning, message);
}

void Logger::logError(const std::string &message) {
    log(Level::Error, message);
}

void Logger::log(Level level, const std::string &message) {
    if (static_cast<int>(level) < minLevel_) {
        return;
    }
    if (message.empty() || message.find_first_not_of(" \t\r\n") == std::string::npos) {
        return;
    }

    std::string formatted = "[" + levelName(level) + "] [" + currentTimestamp() + "] " + message;

    std::lock_guard<std::mutex> lock(logMutex_);
    if (level == Level::Error) {
        std::cerr << formatted << std::endl;
    } else {
        std::cout << formatted << std::endl;
    }

    if (!logFile_.is_open()) {
        return;
    }

    if (currentLogSize_ > MAX_LOG_SIZE) {
        rotateLogFile();
    }

    logFile_ << formatted << std::endl;
    currentLogSize_ += formatted.length() + 1;
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

void Logger::cleanupOldLogs() {
    try {
        if (!fs::exists(logsFolder_)) return;

        auto cutoffTime = fs::file_time_type::clock::now() - LOG_RETENTION;
        std::vector<fs::path> logFiles;

        for (const auto &entry: fs::directory_iterator(logsFolder_)) {
            if (entry.path().extension() != ".log") continue;

            if (fs::last_write_time(entry) < cutoffTime) {
                fs::remove(entry);
            } else {
                logFiles.push_back(entry.path());
            }
        }

        if (logFiles.size() >= MAX_LOG_FILES) {
            std::sort(logFiles.begin(), logFiles.end(), [](const fs::path &a, const fs::path &b) {
                return fs::last_write_time(a) < fs::last_write_time(b);
            });

            // Leave room for the file about to be opened
            for (size_t i = 0; i + MAX_LOG_FILES <= logFiles.size(); ++i) {
                fs::remove(logFiles[i]);
            }
        }
    } catch (const fs::filesystem_error &e) {
        std::cerr << "[Logger] Cleanup error: " << e.what() << std::endl;
    }
}

std::string Logger::levelName(Level level) {
    switch (level) {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warning:
            return "WARNING";
        case Level::Error:
            return "ERROR";
        default:
            return "UNKNOWN";
    }
}

std::string Logger::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << std::put_time(std::localtime(&in_time_t), "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << std::put_time(std::localtime(&in_time_t), "%Y%m%d_%H%M%S");

    std::error_code ec;
    fs::create_directories(logsFolder_, ec);
    if (ec) {
        std::cerr << "[Logger] Cannot create logs folder " << logsFolder_ << ": " << ec.message() << std::endl;
    }

    return (fs::path(logsFolder_) / ("dstdsv_gauge_" + ss.str() + ".log")).string();
}
