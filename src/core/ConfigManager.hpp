/*
 * ConfigManager.hpp
 *
 * INI-style settings ("[Section]" headers, "Key=Value" lines, '#' comments).
 * Keys are addressed as "Section.Key". Implementation lives in the header.
 */
#pragma once
#include <unordered_map>
#include <string>
#include <fstream>
#include <sstream>
#include <set>
#include <filesystem>
#include <vector>
#include <iostream>
#include <stdexcept>
#include "configdesk/Constants.hpp"
#include "util/Env.hpp"

namespace configdesk {
// Path handling helper functions
namespace ConfigPaths {
    // $XDG_CONFIG_HOME/configdesk/, usually ~/.config/configdesk/
    inline std::string DefaultConfigDir() {
        return Env::join({Env::config(), APP_NAME}) + "/";
    }

    // Get path for a config file
    inline std::string GetConfigPath(const std::string& dir, const std::string& filename) {
        if (filename.find('/') != std::string::npos) {
            // If already contains a path separator, use as-is
            return filename;
        }
        return dir + filename;
    }

    // Ensure config directory exists
    inline void EnsureConfigDir(const std::string& dir) {
        namespace fs = std::filesystem;
        try {
            if (!fs::exists(dir)) {
                fs::create_directories(dir);
            }
        } catch (const fs::filesystem_error& e) {
            std::cerr << "Failed to create config directory: " << e.what() << "\n";
        }
    }
}

// Configs class definition
class Configs {
public:
    // Default config values
    static constexpr int DEFAULT_LOG_MAX_DAYS = 3;
    static constexpr int DEFAULT_HTTP_TIMEOUT_MS = 30000;
    static inline const std::string DEFAULT_UPDATE_ENDPOINTS = CONFIGDESK_UPDATE_ENDPOINTS;

    static inline const std::string LOG_LEVEL_KEY = "Logging.Level";
    static inline const std::string LOG_MAX_DAYS_KEY = "Logging.MaxDays";
    static inline const std::string LOG_COLORED_KEY = "Logging.Colored";
    static inline const std::string UPDATE_ON_STARTUP_KEY = "Updater.CheckOnStartup";
    static inline const std::string UPDATE_ENDPOINTS_KEY = "Updater.Endpoints";
    static inline const std::string UPDATE_TIMEOUT_KEY = "Updater.TimeoutMs";
    static inline const std::string RESOURCE_DIR_KEY = "Paths.ResourceDir";

public:
    static Configs& Get() {
        static Configs instance;
        return instance;
    }

    void SetConfigDir(const std::string& dir) {
        configDir = dir;
        if (!configDir.empty() && configDir.back() != '/') configDir += '/';
    }
    const std::string& GetConfigDir() const { return configDir; }

    std::string getPath(const std::string& filename = "main.cfg") const {
        return ConfigPaths::GetConfigPath(configDir, filename);
    }

    void EnsureConfigFile(const std::string& filename = "main.cfg") {
        std::string configPath = getPath(filename);
        ConfigPaths::EnsureConfigDir(configDir);
        namespace fs = std::filesystem;
        if (!fs::exists(configPath)) {
            try {
                std::ofstream file(configPath);
                if (!file.is_open()) throw std::runtime_error("Could not create config file: " + configPath);
                // Write sensible defaults
                file << "[Logging]" << std::endl;
                file << "Level=info" << std::endl;
                file << "MaxDays=" << DEFAULT_LOG_MAX_DAYS << std::endl;
                file << "Colored=true" << std::endl;
                file << "[Updater]" << std::endl;
                file << "CheckOnStartup=true" << std::endl;
                file << "# Comma-separated; {{current_version}}, {{target}} and {{arch}} are substituted" << std::endl;
                file << "Endpoints=" << DEFAULT_UPDATE_ENDPOINTS << std::endl;
                file << "TimeoutMs=" << DEFAULT_HTTP_TIMEOUT_MS << std::endl;
                file << "[Paths]" << std::endl;
                file << "ResourceDir=" << std::endl;
                file.close();
            } catch (const std::exception& e) {
                std::cerr << "Failed to create default config: " << e.what() << std::endl;
            }
        }
    }

    // Replaces whatever was loaded before; a missing file leaves no settings
    void Load(const std::string& filename = "main.cfg") {
        settings.clear();
        std::string configPath = getPath(filename);
        std::ifstream file(configPath);
        if (!file.is_open()) {
            std::cerr << "Warning: Could not open config file: " << configPath << std::endl;
            return;
        }

        std::string line, currentSection;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty() || line[0] == '#') continue;

            if (line[0] == '[') {
                currentSection = line.substr(1, line.find(']')-1);
            }
            else {
                size_t delim = line.find('=');
                if (delim != std::string::npos) {
                    std::string key = currentSection + "." + line.substr(0, delim);
                    std::string value = line.substr(delim+1);
                    settings[key] = value;
                }
            }
        }
    }

    template<typename T>
    T Get(const std::string& key, T defaultValue) const {
        auto it = settings.find(key);
        if (it == settings.end()) return defaultValue;
        try {
            return Convert<T>(it->second);
        } catch (const std::exception& e) {
            std::cerr << "Invalid config value: " << key << "=" << it->second
                      << " (" << e.what() << ")\n";
            return defaultValue;
        }
    }

    // Keys present in the file that nothing reads
    std::vector<std::string> Validate() const {
        const std::set<std::string> validKeys = {
            LOG_LEVEL_KEY, LOG_MAX_DAYS_KEY, LOG_COLORED_KEY,
            UPDATE_ON_STARTUP_KEY, UPDATE_ENDPOINTS_KEY, UPDATE_TIMEOUT_KEY,
            RESOURCE_DIR_KEY
        };

        std::vector<std::string> unknown;
        for(const auto& [key, val] : settings) {
            if(validKeys.find(key) == validKeys.end()) {
                unknown.push_back(key);
            }
        }
        return unknown;
    }

    template<typename T>
    T Get(const std::string& key, T defaultValue, T min, T max) const {
        T value = Get(key, defaultValue);
        if(value < min || value > max) {
            std::cerr << "Config value out of range: " << key
                      << "=" << value << " (Valid: "
                      << min << "-" << max << ")\n";
            return defaultValue;
        }
        return value;
    }

    // Comma-separated list, blanks dropped
    std::vector<std::string> GetList(const std::string& key, const std::string& defaultValue = "") const;

    // Helpers for updater and paths
    bool GetCheckUpdatesOnStartup() const;
    std::vector<std::string> GetUpdateEndpoints() const;
    int GetUpdateTimeoutMs() const;
    std::string GetResourceDir() const;

private:
    Configs() : configDir(ConfigPaths::DefaultConfigDir()) {}

    std::string configDir;
    std::unordered_map<std::string, std::string> settings;

    template<typename T>
    static T Convert(const std::string& val) {
        std::istringstream iss(val);
        T result;
        iss >> result;
        return result;
    }
};

// Template specializations for Configs
template<>
inline bool Configs::Convert<bool>(const std::string& val) {
    return val == "true" || val == "1" || val == "yes";
}

template<>
inline int Configs::Convert<int>(const std::string& val) {
    return std::stoi(val);
}

template<>
inline std::string Configs::Convert<std::string>(const std::string& val) {
    return val;
}

inline std::vector<std::string> Configs::GetList(const std::string& key, const std::string& defaultValue) const {
    std::string raw = Get<std::string>(key, defaultValue);
    std::vector<std::string> result;
    std::istringstream iss(raw);
    std::string token;
    while (std::getline(iss, token, ',')) {
        size_t start = token.find_first_not_of(" \t");
        if (start == std::string::npos) continue;
        size_t end = token.find_last_not_of(" \t");
        result.push_back(token.substr(start, end - start + 1));
    }
    return result;
}

inline bool Configs::GetCheckUpdatesOnStartup() const {
    return Get<bool>(UPDATE_ON_STARTUP_KEY, true);
}

inline std::vector<std::string> Configs::GetUpdateEndpoints() const {
    // A blank Endpoints= line means "use the built-in list"
    auto endpoints = GetList(UPDATE_ENDPOINTS_KEY, DEFAULT_UPDATE_ENDPOINTS);
    if (endpoints.empty()) {
        endpoints = GetList("", DEFAULT_UPDATE_ENDPOINTS);
    }
    return endpoints;
}

inline int Configs::GetUpdateTimeoutMs() const {
    return Get<int>(UPDATE_TIMEOUT_KEY, DEFAULT_HTTP_TIMEOUT_MS, 1000, 600000);
}

inline std::string Configs::GetResourceDir() const {
    return Get<std::string>(RESOURCE_DIR_KEY, "");
}

} // namespace configdesk
