// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

/**
 * Configuration System
 *
 * Bitcoin Core-style configuration file and environment variable support.
 * Reads key=value settings (e.g. from abifuzz.conf) and allows environment
 * variable overrides.
 */

#ifndef ABIFUZZ_UTIL_CONFIG_H
#define ABIFUZZ_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>

/** Prefix of environment variables that override config keys */
static const char* const CONFIG_ENV_PREFIX = "ABIFUZZ_";

/**
 * Configuration file parser
 *
 * Supports:
 * - Key=value pairs
 * - Comments (# and ;)
 * - Section headers [section] (ignored)
 * - Environment variable overrides (ABIFUZZ_*)
 */
class CConfigParser {
private:
    std::map<std::string, std::string> m_settings;
    std::string m_config_file_path;
    bool m_loaded;

    // Helper: Trim whitespace
    static std::string Trim(const std::string& str);

    // Helper: Parse line
    bool ParseLine(const std::string& line, std::string& key, std::string& value);

    // Helper: Get environment variable
    static std::optional<std::string> GetEnv(const std::string& name);

    // Helper: Read all settings from a stream
    void ParseStream(std::istream& stream);

public:
    CConfigParser();

    /**
     * Load configuration from file
     * @param file_path Path to abifuzz.conf
     * @return true if loaded successfully (or file doesn't exist)
     */
    bool LoadConfigFile(const std::string& file_path);

    /**
     * Load configuration from in-memory text in the same format as the file
     */
    void LoadConfigString(const std::string& text);

    /**
     * Get string value
     * Priority: Environment variable > Config file > Default
     * @param key Configuration key (e.g., "arraymaxsize")
     * @param default_value Default value if not found
     * @return Configuration value or default
     */
    std::string GetString(const std::string& key, const std::string& default_value = "") const;

    /**
     * Get integer value
     * @return Configuration value, or default if missing or malformed
     */
    int64_t GetInt64(const std::string& key, int64_t default_value = 0) const;

    /**
     * Get floating point value (biases and probabilities)
     * @return Configuration value, or default if missing or malformed
     */
    double GetDouble(const std::string& key, double default_value = 0.0) const;

    /**
     * Get boolean value
     * Supports: 1, 0, true, false, yes, no, on, off
     */
    bool GetBool(const std::string& key, bool default_value = false) const;

    /**
     * Whether a key is set by the environment or the loaded file
     */
    bool IsSet(const std::string& key) const;

    bool IsLoaded() const { return m_loaded; }

    std::string GetConfigFilePath() const { return m_config_file_path; }

    std::map<std::string, std::string> GetAllSettings() const { return m_settings; }
};

#endif // ABIFUZZ_UTIL_CONFIG_H
