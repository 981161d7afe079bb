#include "logger/Logger.hpp"

#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>

namespace fs = std::filesystem;

std::ofstream Logger::logFile_;
std::mutex Logger::logMutex_;
std::string Logger::logDirectory_ = "logs";
std::string Logger::currentLogPath_;
std::atomic<size_t> Logger::currentLogSize_{0};
std::atomic<int> Logger::minLevel_{static_cast<int>(Logger::Level::Info)};

constexpr size_t MAX_LOG_SIZE = 10 * 1024 * 1024; // 10MB

void Logger::init(const std::string &logDirectory) {
    std::lock_guard<std::mutex> lock(logMutex_);
    logDirectory_ = logDirectory;
    rotateLogFile();
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

Logger::Level Logger::getLevel() {
    return static_cast<Level>(minLevel_.load());
}

Logger::Level Logger::levelFromString(const std::string &name) {
    if (name == "debug") return Level::Debug;
    if (name == "warning") return Level::Warning;
    if (name == "error") return Level::Error;
    return Level::Info;
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

    std::string formatted = std::string("[") + levelName(level) + "] [" + currentTimestamp() + "] " + message;

    if (level == Level::Error) {
        std::cerr << formatted << std::endl;
    } else {
        std::cout << formatted << std::endl;
    }

    std::lock_guard<std::mutex> lock(logMutex_);
    if (logFile_.is_open() && currentLogSize_ > MAX_LOG_SIZE) {
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
    if (!fs::exists(logDirectory_, ec)) {
        fs::create_directories(logDirectory_, ec);
    }

    std::string base = logDirectory_ + "/escpos_" + ss.str();
    std::string path = base + ".log";
    for (int sequence = 1; fs::exists(path, ec); ++sequence) {
        path = base + "_" + std::to_string(sequence) + ".log";
    }
    return path;
}

const char *Logger::levelName(Level level) {
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
