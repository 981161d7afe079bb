#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>

class Logger {
public:
    enum class Level {
        Debug = 0,
        Info = 1,
        Warning = 2,
        Error = 3
    };

    /**
     * @brief Opens a log file in logDirectory. Without init() the logger only
     * writes to the console.
     */
    static void init(const std::string &logDirectory = "logs");

    static void shutdown();

    static void setLevel(Level level);

    static Level getLevel();

    /**
     * @brief "debug", "info", "warning" or "error"; anything else maps to Info.
     */
    static Level levelFromString(const std::string &name);

    static void logDebug(const std::string &message);

    static void logInfo(const std::string &message);

    static void logWarning(const std::string &message);

    static void logError(const std::string &message);

private:
    static std::ofstream logFile_;
    static std::mutex logMutex_;
    static std::string logDirectory_;
    static std::string currentLogPath_;
    static std::atomic<size_t> currentLogSize_;
    static std::atomic<int> minLevel_;

    static void log(Level level, const std::string &message);

    static void rotateLogFile();

    static std::string currentTimestamp();

    static std::string generateLogFilename();

    static const char *levelName(Level level);
};
