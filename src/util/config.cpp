// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#include <util/config.h>
#include <util/logging.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string EnvKeyFor(const std::string& key) {
    std::string env_key = CONFIG_ENV_PREFIX + key;
    std::transform(env_key.begin(), env_key.end(), env_key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return env_key;
}

} // namespace

CConfigParser::CConfigParser() : m_loaded(false) {
}

std::string CConfigParser::Trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

bool CConfigParser::ParseLine(const std::string& line, std::string& key, std::string& value) {
    // Remove comments
    std::string clean_line = line;
    size_t comment_pos = clean_line.find('#');
    if (comment_pos != std::string::npos) {
        clean_line = clean_line.substr(0, comment_pos);
    }
    comment_pos = clean_line.find(';');
    if (comment_pos != std::string::npos) {
        clean_line = clean_line.substr(0, comment_pos);
    }

    clean_line = Trim(clean_line);
    if (clean_line.empty()) {
        return false;  // Empty line or comment only
    }

    // Skip section headers [section]
    if (clean_line[0] == '[' && clean_line.back() == ']') {
        return false;
    }

    size_t eq_pos = clean_line.find('=');
    if (eq_pos == std::string::npos) {
        return false;  // No equals sign
    }

    key = Trim(clean_line.substr(0, eq_pos));
    value = Trim(clean_line.substr(eq_pos + 1));

    // Remove quotes if present
    if (value.length() >= 2 && value[0] == '"' && value.back() == '"') {
        value = value.substr(1, value.length() - 2);
    }

    return !key.empty();
}

std::optional<std::string> CConfigParser::GetEnv(const std::string& name) {
    const char* env_value = std::getenv(name.c_str());
    if (env_value == nullptr) {
        return std::nullopt;
    }
    return std::string(env_value);
}

void CConfigParser::ParseStream(std::istream& stream) {
    std::string line;
    while (std::getline(stream, line)) {
        std::string key, value;
        if (ParseLine(line, key, value)) {
            key = ToLower(key);
            m_settings[key] = value;
            LogPrintConfig(DEBUG, "Config: %s = %s", key.c_str(), value.c_str());
        }
    }
}

bool CConfigParser::LoadConfigFile(const std::string& file_path) {
    m_config_file_path = file_path;
    m_settings.clear();
    m_loaded = false;

    std::ifstream file(file_path);
    if (!file.is_open()) {
        // File doesn't exist - this is OK, use defaults
        LogPrintConfig(DEBUG, "Config file not found: %s (using defaults)", file_path.c_str());
        m_loaded = true;
        return true;
    }

    ParseStream(file);
    if (file.bad()) {
        LogPrintConfig(ERROR, "Failed reading config file %s", file_path.c_str());
        return false;
    }

    m_loaded = true;
    if (!m_settings.empty()) {
        LogPrintConfig(INFO, "Loaded configuration from %s (%zu settings)",
                       file_path.c_str(), m_settings.size());
    }
    return true;
}

void CConfigParser::LoadConfigString(const std::string& text) {
    m_config_file_path.clear();
    m_settings.clear();

    std::istringstream stream(text);
    ParseStream(stream);
    m_loaded = true;
}

std::string CConfigParser::GetString(const std::string& key, const std::string& default_value) const {
    // Priority 1: Environment variable (ABIFUZZ_*)
    auto env_value = GetEnv(EnvKeyFor(key));
    if (env_value.has_value()) {
        LogPrintConfig(DEBUG, "Config: %s = %s (from environment)",
                       key.c_str(), env_value->c_str());
        return *env_value;
    }

    // Priority 2: Config file
    auto it = m_settings.find(ToLower(key));
    if (it != m_settings.end()) {
        return it->second;
    }

    // Priority 3: Default
    return default_value;
}

int64_t CConfigParser::GetInt64(const std::string& key, int64_t default_value) const {
    std::string value = GetString(key, "");
    if (value.empty()) {
        return default_value;
    }

    try {
        size_t consumed = 0;
        int64_t result = std::stoll(value, &consumed);
        if (consumed == value.size()) {
            return result;
        }
    } catch (const std::exception&) {
        // fall through to the warning below
    }

    LogPrintConfig(WARN, "Config: Invalid integer value for %s: %s (using default: %lld)",
                   key.c_str(), value.c_str(), static_cast<long long>(default_value));
    return default_value;
}

double CConfigParser::GetDouble(const std::string& key, double default_value) const {
    std::string value = GetString(key, "");
    if (value.empty()) {
        return default_value;
    }

    try {
        size_t consumed = 0;
        double result = std::stod(value, &consumed);
        if (consumed == value.size()) {
            return result;
        }
    } catch (const std::exception&) {
        // fall through to the warning below
    }

    LogPrintConfig(WARN, "Config: Invalid numeric value for %s: %s (using default: %g)",
                   key.c_str(), value.c_str(), default_value);
    return default_value;
}

bool CConfigParser::GetBool(const std::string& key, bool default_value) const {
    std::string value = ToLower(GetString(key, ""));
    if (value.empty()) {
        return default_value;
    }

    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }

    LogPrintConfig(WARN, "Config: Invalid boolean value for %s: %s (using default: %s)",
                   key.c_str(), value.c_str(), default_value ? "true" : "false");
    return default_value;
}

bool CConfigParser::IsSet(const std::string& key) const {
    if (GetEnv(EnvKeyFor(key)).has_value()) {
        return true;
    }
    return m_settings.count(ToLower(key)) > 0;
}
