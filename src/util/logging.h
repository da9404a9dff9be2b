// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#ifndef ABIFUZZ_UTIL_LOGGING_H
#define ABIFUZZ_UTIL_LOGGING_H

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <memory>
#include <cstdint>

/**
 * Bitcoin Core-style logging system
 *
 * Features:
 * - Log categories (GENERATION, MUTATION, CORPUS, ...)
 * - Log levels (ERROR, WARN, INFO, DEBUG)
 * - Thread-safe logging
 * - Console and optional file output
 */

/**
 * Log categories
 */
enum class LogCategory : uint32_t {
    NONE = 0,
    GENERATION = (1 << 0),    // Value generation
    MUTATION = (1 << 1),      // Value mutation rounds
    CORPUS = (1 << 2),        // Value set inserts/samples
    CODEC = (1 << 3),         // JSON encode/decode
    CONFIG = (1 << 4),        // Configuration loading/validation
    ALL = 0xFFFFFFFF          // All categories
};

/**
 * Log levels
 * Note: Using LVL_ prefix to avoid conflicts with Windows ERROR macro
 */
enum class LogLevel {
    LVL_ERROR = 0,
    LVL_WARN = 1,
    LVL_INFO = 2,
    LVL_DEBUG = 3
};

/**
 * Logging configuration
 */
class CLoggingConfig {
public:
    static CLoggingConfig& GetInstance();

    // Enable/disable categories
    void EnableCategory(LogCategory category);
    void DisableCategory(LogCategory category);
    bool IsCategoryEnabled(LogCategory category) const;

    // Set log level
    void SetLogLevel(LogLevel level);
    LogLevel GetLogLevel() const;

    // File logging
    void SetLogFile(const std::string& path);
    std::string GetLogFile() const;
    bool IsFileLoggingEnabled() const;

    // Console logging
    void SetConsoleLogging(bool enable);
    bool IsConsoleLoggingEnabled() const { return m_consoleLogging; }

private:
    CLoggingConfig();
    ~CLoggingConfig() = default;

    std::atomic<uint32_t> m_enabledCategories{static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<LogLevel> m_logLevel{LogLevel::LVL_INFO};
    std::string m_logFile;
    std::atomic<bool> m_consoleLogging{true};
    mutable std::mutex m_configMutex;
};

/**
 * Main logging class
 */
class CLogger {
public:
    static CLogger& GetInstance();

    // Open the configured log file (no-op when file logging is disabled)
    bool Initialize();

    // Flush and close the log file
    void Shutdown();

    // Log a message
    void Log(LogCategory category, LogLevel level, const std::string& message);

    void LogPrintFormat(LogCategory category, LogLevel level, const char* format, ...);

    // Whether a message would be emitted (lets callers skip costly formatting)
    bool WillLog(LogCategory category, LogLevel level) const;

private:
    CLogger();
    ~CLogger();

    void WriteToFile(const std::string& message);
    void WriteToConsole(LogLevel level, const std::string& message);

    // Format log message (not FormatMessage to avoid Windows API conflict)
    std::string FormatLogMsg(LogCategory category, LogLevel level, const std::string& message);

    std::unique_ptr<std::ofstream> m_logFile;
    std::mutex m_logMutex;
    std::atomic<bool> m_initialized{false};
};

const char* LogCategoryName(LogCategory category);
const char* LogLevelName(LogLevel level);

// Convenience macros (Bitcoin Core style)
#define LogPrintf(category, level, format, ...) \
    CLogger::GetInstance().LogPrintFormat(LogCategory::category, LogLevel::LVL_##level, format, ##__VA_ARGS__)

// Category-specific macros (with format string)
#define LogPrintGeneration(level, format, ...) LogPrintf(GENERATION, level, format, ##__VA_ARGS__)
#define LogPrintMutation(level, format, ...) LogPrintf(MUTATION, level, format, ##__VA_ARGS__)
#define LogPrintCorpus(level, format, ...) LogPrintf(CORPUS, level, format, ##__VA_ARGS__)
#define LogPrintCodec(level, format, ...) LogPrintf(CODEC, level, format, ##__VA_ARGS__)
#define LogPrintConfig(level, format, ...) LogPrintf(CONFIG, level, format, ##__VA_ARGS__)

#define LogInfo(...) LogPrintf(ALL, INFO, __VA_ARGS__)
#define LogError(...) LogPrintf(ALL, ERROR, __VA_ARGS__)
#define LogWarn(...) LogPrintf(ALL, WARN, __VA_ARGS__)
#define LogDebug(...) LogPrintf(ALL, DEBUG, __VA_ARGS__)

#endif // ABIFUZZ_UTIL_LOGGING_H
