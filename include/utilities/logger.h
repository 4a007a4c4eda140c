#pragma once
#ifndef CTVERIFY_LOGGER_H
#define CTVERIFY_LOGGER_H
#include <fstream>
#include <map>
#include <mutex>
#include <string>

namespace ctverify {

enum LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

/**
 * @brief Parse a level name ("debug", "INFO", ...).
 * @throws std::invalid_argument for unknown names.
 */
LogLevel logLevelFromString(const std::string &name);

class Logger
{
public:
    using Fields = std::map<std::string, std::string>;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static const std::string CONSOLE_ONLY_OUTPUT; // Special value for console-only logging

    static void init(const std::string& logFile, LogLevel level = LogLevel::INFO, long long maxFileSize = 10 * 1024 * 1024, int maxBackupFiles = 5);
    static Logger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel logLevel() const;

    void log(LogLevel level, const std::string& message);

    /**
     * @brief Log a message with structured context.
     *
     * Each field becomes a key of the emitted JSON object next to
     * timestamp, level and message.
     */
    void log(LogLevel level, const std::string& message, const Fields& fields);

    ~Logger();

private:
    Logger(const std::string& logFile, LogLevel level, long long maxFileSizeVal, int maxBackupFilesVal);

    std::string getTimestamp();
    std::string formatLine(LogLevel level, const std::string& message, const Fields& fields);
    void rotateIfNeeded();

    std::ofstream logFileStream;
    LogLevel currentLogLevel;
    std::string logFilePath;
    long long maxFileSize;
    int maxBackupFiles;

    static Logger* s_instance;
    static std::recursive_mutex s_mutex;
};

std::string levelToString(LogLevel level);

} // namespace ctverify

#endif
