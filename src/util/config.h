// Copyright (c) 2025 The Bitwire Core developers
// Distributed under the MIT software license

/**
 * Configuration file and environment variable support.
 * Reads from bitwire.conf and allows environment variable overrides.
 */

#ifndef BITWIRE_UTIL_CONFIG_H
#define BITWIRE_UTIL_CONFIG_H

#include <cstdint>
#include <string>
#include <map>
#include <vector>
#include <optional>

/**
 * Configuration file parser
 *
 * Supports:
 * - Key=value pairs (keys are case-insensitive)
 * - Comments (# and ;)
 * - Section headers [section] (ignored)
 * - Environment variable overrides (BITWIRE_*)
 */
class CConfigParser {
private:
    // Every value seen for a key, in file order
    std::map<std::string, std::vector<std::string>> m_settings;
    std::string m_config_file_path;
    bool m_loaded;

    // Helper: Parse line
    static bool ParseLine(const std::string& line, std::string& key, std::string& value);

    // Helper: Get environment variable
    static std::optional<std::string> GetEnv(const std::string& name);


public:
    CConfigParser();

    /**
     * Load configuration from file
     * @param file_path Path to bitwire.conf
     * @return true if loaded successfully (or file doesn't exist), false on read error
     */
    bool LoadConfigFile(const std::string& file_path);

    /**
     * Load configuration from an in-memory string (same syntax as the file)
     */
    void LoadConfigString(const std::string& contents);

    /**
     * Get string value
     * Priority: Environment variable > Config file > Default
     * When a key appears more than once in the file, the last value wins.
     */
    std::string GetString(const std::string& key, const std::string& default_value = "") const;

    /**
     * Get integer value; malformed values log a warning and yield the default
     */
    int64_t GetInt64(const std::string& key, int64_t default_value = 0) const;

    /**
     * Get boolean value
     * Supports: 1, 0, true, false, yes, no, on, off
     */
    bool GetBool(const std::string& key, bool default_value = false) const;

    /**
     * Get every value of a multi-value key. An environment override is
     * split on commas.
     */
    std::vector<std::string> GetList(const std::string& key) const;

    bool IsLoaded() const { return m_loaded; }

    std::string GetConfigFilePath() const { return m_config_file_path; }

    size_t size() const { return m_settings.size(); }
};

/**
 * Get default data directory (~/.bitwire)
 */
std::string GetDefaultDataDir();

/**
 * Get default config file path
 * @param datadir Data directory (if empty, uses default)
 * @return Path to bitwire.conf
 */
std::string GetConfigFilePath(const std::string& datadir = "");

#endif // BITWIRE_UTIL_CONFIG_H
