#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>

#include "remap/logging.hpp"

namespace remap {

class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from environment variables and optional config file
    bool load(const std::string& config_file = "") {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            load_from_env();
        }

        if (!config_file.empty() && std::filesystem::exists(config_file)) {
            load_from_file(config_file);
        }

        return validate();
    }

    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                return std::stoi(it->second);
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(), ::tolower);
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else {
                return it->second;
            }
        } catch (const std::exception&) {
            LOG_WARN("Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : values_) {
            LOG_INFO("  ", key, " = ", value);
        }
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void load_from_env() {
        set_if_env("log.level", "REMAP_LOG_LEVEL", "warn");
        set_if_env("log.file", "REMAP_LOG_FILE", "");

        // Walk endpoints and seed interpretation
        set_if_env("walk.from", "REMAP_FROM", "seed");
        set_if_env("walk.to", "REMAP_TO", "location");
        set_if_env("walk.mode", "REMAP_MODE", "values");
    }

    void set_if_env(const std::string& key, const std::string& env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && *env_value) {
            values_[key] = env_value;
        } else if (values_.find(key) == values_.end()) {
            values_[key] = default_value;
        }
    }

    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_WARN("Could not open config file: ", filename);
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos != std::string::npos) {
                std::string key = trim(line.substr(0, equals_pos));
                std::string value = trim(line.substr(equals_pos + 1));
                if (!key.empty()) {
                    values_[key] = value;
                }
            }
        }
    }

    static std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) { return !std::isspace(ch); }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](int ch) { return !std::isspace(ch); }).base(), s.end());
        return s;
    }

    bool validate() {
        bool valid = true;

        LogLevel level;
        if (!parse_log_level(get<std::string>("log.level"), level)) {
            LOG_WARN("Unknown log level '", get<std::string>("log.level"), "', defaulting to 'warn'");
            set("log.level", "warn");
        }

        std::string mode = get<std::string>("walk.mode");
        if (mode != "values" && mode != "ranges") {
            LOG_ERROR("Invalid walk mode '", mode, "' (expected 'values' or 'ranges')");
            valid = false;
        }

        if (get<std::string>("walk.from").empty() || get<std::string>("walk.to").empty()) {
            LOG_ERROR("Walk endpoints must not be empty");
            valid = false;
        }

        return valid;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Loads the configuration and applies its logging settings
inline bool init_config(const std::string& config_file = "remap.conf") {
    Config& config = Config::getInstance();

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    LogLevel level = LogLevel::WARN;
    if (parse_log_level(config.get<std::string>("log.level"), level)) {
        set_log_level(level);
    }

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }

    LOG_DEBUG("Configuration loaded");
    return true;
}

} // namespace remap
