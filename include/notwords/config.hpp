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
#include "logging.hpp"

namespace notwords {

/**
 * Process-wide key/value configuration.
 *
 * Values come from NW_* environment variables first, then from an optional
 * "key = value" file. The secret key is never part of configuration.
 */
class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from environment variables and optional config file
    bool load(const std::string& config_file = "") {
        std::lock_guard<std::mutex> lock(mutex_);

        load_from_env();

        if (!config_file.empty()) {
            if (!std::filesystem::exists(config_file)) {
                LOG_WARN("Config file not found: ", config_file);
            } else if (!load_from_file(config_file)) {
                return false;
            }
        }

        return validate();
    }

    // Get configuration value with default
    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return get_unlocked<T>(key, default_value);
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        return it != values_.end() && !it->second.empty();
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }

    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        LOG_DEBUG("Current configuration:");
        for (const auto& [key, value] : values_) {
            LOG_DEBUG("  ", key, " = ", value);
        }
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    template<typename T>
    T get_unlocked(const std::string& key, T default_value) const {
        auto it = values_.find(key);
        if (it == values_.end() || it->second.empty()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                return std::stoi(it->second);
            } else if constexpr (std::is_same_v<T, double>) {
                return std::stod(it->second);
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else {
                return it->second;
            }
        } catch (const std::exception&) {
            LOG_WARN("Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
    }

    void load_from_env() {
        set_if_env("log.level", "NW_LOG_LEVEL", "warn");
        set_if_env("log.file", "NW_LOG_FILE", "");

        // Optional word-list files; the built-in vocabularies are used when unset
        set_if_env("words.three", "NW_WORDS_THREE", "");
        set_if_env("words.four", "NW_WORDS_FOUR", "");
        set_if_env("words.six", "NW_WORDS_SIX", "");

        set_if_env("codec.default_words", "NW_DEFAULT_WORDS", "3");
    }

    void set_if_env(const std::string& key, const std::string& env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && *env_value) {
            values_[key] = env_value;
        } else if (values_.find(key) == values_.end()) {
            values_[key] = default_value;
        }
    }

    static std::string trim(const std::string& s) {
        auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
        auto begin = std::find_if(s.begin(), s.end(), not_space);
        auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
        return begin < end ? std::string(begin, end) : std::string();
    }

    bool load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_ERROR("Could not open config file: ", filename);
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos == std::string::npos) {
                LOG_WARN("Ignoring malformed config line: ", line);
                continue;
            }

            std::string key = trim(line.substr(0, equals_pos));
            std::string value = trim(line.substr(equals_pos + 1));
            if (!key.empty()) {
                values_[key] = value;
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
        return true;
    }

    bool validate() {
        bool valid = true;

        int words = get_unlocked<int>("codec.default_words", 3);
        if (words != 3 && words != 4 && words != 6) {
            LOG_ERROR("Invalid codec.default_words: ", words, " (expected 3, 4 or 6)");
            valid = false;
        }

        LogLevel level;
        if (!parse_log_level(get_unlocked<std::string>("log.level", "warn"), level)) {
            LOG_WARN("Unknown log level '", values_["log.level"], "', defaulting to 'warn'");
            values_["log.level"] = "warn";
        }

        return valid;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Apply configuration to the logger and report whether it is usable
inline bool init_config(const std::string& config_file = "") {
    Config& config = Config::getInstance();

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    LogLevel level;
    if (parse_log_level(config.get<std::string>("log.level", "warn"), level)) {
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

    config.print();
    return true;
}

} // namespace notwords
