// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#include <util/logging.h>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <cstdarg>
#include <cstdio>

// CLoggingConfig implementation
CLoggingConfig& CLoggingConfig::GetInstance() {
    static CLoggingConfig instance;
    return instance;
}

CLoggingConfig::CLoggingConfig() {
    // Default: enable all categories, INFO level
    m_enabledCategories = static_cast<uint32_t>(LogCategory::ALL);
    m_logLevel = LogLevel::LVL_INFO;
}

void CLoggingConfig::EnableCategory(LogCategory category) {
    m_enabledCategories.fetch_or(static_cast<uint32_t>(category));
}

void CLoggingConfig::DisableCategory(LogCategory category) {
    m_enabledCategories.fetch_and(~static_cast<uint32_t>(category));
}

bool CLoggingConfig::IsCategoryEnabled(LogCategory category) const {
    uint32_t cat = static_cast<uint32_t>(category);
    uint32_t enabled = m_enabledCategories.load();
    return (enabled & cat) != 0;
}

void CLoggingConfig::SetLogLevel(LogLevel level) {
    m_logLevel.store(level);
}

LogLevel CLoggingConfig::GetLogLevel() const {
    return m_logLevel.load();
}

void CLoggingConfig::SetLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_configMutex);
    m_logFile = path;
}

std::string CLoggingConfig::GetLogFile() const {
    std::lock_guard<std::mutex> lock(m_configMutex);
    return m_logFile;
}

bool CLoggingConfig::IsFileLoggingEnabled() const {
    std::lock_guard<std::mutex> lock(m_configMutex);
    return !m_logFile.empty();
}

void CLoggingConfig::SetConsoleLogging(bool enable) {
    m_consoleLogging.store(enable);
}

// CLogger implementation
CLogger& CLogger::GetInstance() {
    static CLogger instance;
    return instance;
}

CLogger::CLogger() {
}

CLogger::~CLogger() {
    Shutdown();
}

bool CLogger::Initialize() {
    std::lock_guard<std::mutex> lock(m_logMutex);

    if (m_initialized.load()) {
        return true;  // Already initialized
    }

    CLoggingConfig& config = CLoggingConfig::GetInstance();
    if (config.IsFileLoggingEnabled()) {
        std::string logPath = config.GetLogFile();
        m_logFile = std::make_unique<std::ofstream>(logPath, std::ios::app);
        if (!m_logFile->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << logPath << std::endl;
            m_logFile.reset();
            return false;
        }
    }

    m_initialized.store(true);
    return true;
}

void CLogger::Shutdown() {
    std::lock_guard<std::mutex> lock(m_logMutex);

    if (m_logFile && m_logFile->is_open()) {
        m_logFile->flush();
        m_logFile->close();
    }
    m_logFile.reset();

    m_initialized.store(false);
}

bool CLogger::WillLog(LogCategory category, LogLevel level) const {
    CLoggingConfig& config = CLoggingConfig::GetInstance();
    return config.IsCategoryEnabled(category) && level <= config.GetLogLevel();
}

void CLogger::Log(LogCategory category, LogLevel level, const std::string& message) {
    if (!WillLog(category, level)) {
        return;
    }

    std::string formatted = FormatLogMsg(category, level, message);

    std::lock_guard<std::mutex> lock(m_logMutex);

    if (CLoggingConfig::GetInstance().IsConsoleLoggingEnabled()) {
        WriteToConsole(level, formatted);
    }

    if (m_initialized.load() && m_logFile && m_logFile->is_open()) {
        WriteToFile(formatted);
    }
}

void CLogger::LogPrintFormat(LogCategory category, LogLevel level, const char* format, ...) {
    if (!WillLog(category, level)) {
        return;
    }

    char buffer[4096];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    Log(category, level, std::string(buffer));
}

void CLogger::WriteToFile(const std::string& message) {
    *m_logFile << message << std::endl;
}

void CLogger::WriteToConsole(LogLevel level, const std::string& message) {
    std::ostream& stream = (level == LogLevel::LVL_ERROR) ? std::cerr : std::cout;
    stream << message << std::endl;
}

const char* LogCategoryName(LogCategory category) {
    switch (category) {
        case LogCategory::GENERATION: return "GENERATION";
        case LogCategory::MUTATION: return "MUTATION";
        case LogCategory::CORPUS: return "CORPUS";
        case LogCategory::CODEC: return "CODEC";
        case LogCategory::CONFIG: return "CONFIG";
        case LogCategory::NONE:
        case LogCategory::ALL:
            break;
    }
    return "";
}

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::LVL_ERROR: return "ERROR";
        case LogLevel::LVL_WARN: return "WARN";
        case LogLevel::LVL_INFO: return "INFO";
        case LogLevel::LVL_DEBUG: return "DEBUG";
    }
    return "";
}

std::string CLogger::FormatLogMsg(LogCategory category, LogLevel level, const std::string& message) {
    std::ostringstream oss;

    // Timestamp
    std::time_t now = std::time(nullptr);
    std::tm* tm = std::localtime(&now);
    oss << std::put_time(tm, "%Y-%m-%d %H:%M:%S");

    oss << " [" << LogLevelName(level) << "]";

    const char* catStr = LogCategoryName(category);
    if (catStr[0] != '\0') {
        oss << " [" << catStr << "]";
    }

    oss << " " << message;

    return oss.str();
}
