// Copyright (c) 2025 The Bitwire Core developers
// Distributed under the MIT software license

#include <util/config.h>
#include <util/logging.h>
#include <util/strencodings.h>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

#ifndef _WIN32
    #include <unistd.h>
    #include <pwd.h>
#endif

CConfigParser::CConfigParser() : m_loaded(false) {
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

    clean_line = TrimString(clean_line);
    if (clean_line.empty()) {
        return false;  // Empty line or comment only
    }

    // Skip section headers [section]
    if (clean_line[0] == '[' && clean_line.back() == ']') {
        return false;
    }

    size_t eq_pos = clean_line.find('=');
    if (eq_pos == std::string::npos) {
        return false;
    }

    key = TrimString(clean_line.substr(0, eq_pos));
    value = TrimString(clean_line.substr(eq_pos + 1));

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

void CConfigParser::LoadConfigString(const std::string& contents) {
    std::istringstream stream(contents);
    std::string line;
    int line_num = 0;
    while (std::getline(stream, line)) {
        line_num++;
        std::string key, value;
        if (ParseLine(line, key, value)) {
            key = ToLower(key);
            m_settings[key].push_back(value);
            LogPrintConfig(DEBUG, "Config line %d: %s = %s", line_num, key.c_str(), value.c_str());
        }
    }
    m_loaded = true;
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

    std::stringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        LogPrintConfig(ERROR, "Failed to read config file %s", file_path.c_str());
        return false;
    }

    LoadConfigString(contents.str());
    if (!m_settings.empty()) {
        LogPrintConfig(DEBUG, "Loaded configuration from %s (%zu settings)",
                       file_path.c_str(), m_settings.size());
    }
    return true;
}

std::string CConfigParser::GetString(const std::string& key, const std::string& default_value) const {
    std::string key_lower = ToLower(key);

    // Priority 1: Environment variable (BITWIRE_*)
    std::string env_key = ToUpper("BITWIRE_" + key);
    auto env_value = GetEnv(env_key);
    if (env_value.has_value()) {
        LogPrintConfig(DEBUG, "Config: %s = %s (from environment)",
                       key.c_str(), env_value->c_str());
        return *env_value;
    }

    // Priority 2: Config file
    auto it = m_settings.find(key_lower);
    if (it != m_settings.end() && !it->second.empty()) {
        return it->second.back();
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
        size_t pos = 0;
        int64_t result = std::stoll(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return result;
    } catch (const std::exception&) {
        LogPrintConfig(WARN, "Config: Invalid integer value for %s: %s (using default: %lld)",
                       key.c_str(), value.c_str(), static_cast<long long>(default_value));
        return default_value;
    }
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

std::vector<std::string> CConfigParser::GetList(const std::string& key) const {
    std::vector<std::string> result;

    // Environment variable (comma-separated)
    std::string env_key = ToUpper("BITWIRE_" + key);
    auto env_value = GetEnv(env_key);
    if (env_value.has_value()) {
        std::stringstream ss(*env_value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = TrimString(item);
            if (!item.empty()) {
                result.push_back(item);
            }
        }
        return result;
    }

    auto it = m_settings.find(ToLower(key));
    if (it != m_settings.end()) {
        result = it->second;
    }

    return result;
}

std::string GetDefaultDataDir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (home != nullptr) {
        return std::string(home) + "\\.bitwire";
    }
    return ".bitwire";
#else
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        struct passwd* pwd = getpwuid(getuid());
        if (pwd != nullptr) {
            home = pwd->pw_dir;
        }
    }

    if (home != nullptr) {
        return std::string(home) + "/.bitwire";
    }

    // Fallback
    return ".bitwire";
#endif
}

std::string GetConfigFilePath(const std::string& datadir) {
    std::string dir = datadir.empty() ? GetDefaultDataDir() : datadir;

#ifdef _WIN32
    return dir + "\\bitwire.conf";
#else
    return dir + "/bitwire.conf";
#endif
}
