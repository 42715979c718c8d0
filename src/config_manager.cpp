#include "../include/config_manager.hpp"
#include "../include/logger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

/**
 * @file config_manager.cpp
 * @brief Implementation of the `.env` configuration store.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    std::unordered_map<std::string, std::string> ConfigManager::cache_;
    std::mutex ConfigManager::mutex_;

    namespace {

        std::string trimWhitespace(const std::string& input) {
            auto start = std::find_if_not(input.begin(), input.end(),
                                          [](unsigned char c) { return std::isspace(c); });
            auto end = std::find_if_not(input.rbegin(), input.rend(),
                                        [](unsigned char c) { return std::isspace(c); }).base();
            if (start >= end) return std::string();
            return std::string(start, end);
        }
    }

    bool ConfigManager::initialize(const std::string& env_path) {
        clear();

        std::ifstream file(env_path);
        if (!file.is_open()) {
            Logger::warning("Config file not found: " + env_path, __FILE__, __LINE__);
            return false;
        }

        parseLines(file);
        return true;
    }

    void ConfigManager::loadFromString(const std::string& content) {
        std::istringstream in(content);
        parseLines(in);
    }

    void ConfigManager::parseLines(std::istream& in) {
        std::string line;
        while (std::getline(in, line)) {
            std::string trimmed = trimWhitespace(line);
            if (trimmed.empty() || trimmed[0] == '#') continue;

            auto pos = trimmed.find('=');
            if (pos == std::string::npos) continue;

            std::string key = trimWhitespace(trimmed.substr(0, pos));
            std::string value = trimWhitespace(trimmed.substr(pos + 1));
            if (!key.empty()) set(key, value);
        }
    }

    void ConfigManager::set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_[key] = value;
    }

    void ConfigManager::clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_.clear();
    }

    std::optional<std::string> ConfigManager::get(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it == cache_.end()) return std::nullopt;
        return it->second;
    }

    std::string ConfigManager::getOrThrow(const std::string& key) {
        auto v = get(key);
        if (!v) throw std::runtime_error("Missing required config: " + key);
        return *v;
    }

    std::string ConfigManager::getOr(const std::string& key, const std::string& default_value) {
        auto v = get(key);
        return v ? *v : default_value;
    }

    int ConfigManager::getIntOr(const std::string& key, int default_value) {
        auto v = get(key);
        if (!v) return default_value;
        try {
            size_t used = 0;
            int parsed = std::stoi(*v, &used);
            if (used != v->size()) throw std::invalid_argument(*v);
            return parsed;
        } catch (const std::exception&) {
            Logger::warning("Ignoring non-integer value for " + key + ": " + *v,
                            __FILE__, __LINE__);
            return default_value;
        }
    }

    bool ConfigManager::getBoolOr(const std::string& key, bool default_value) {
        auto v = get(key);
        if (!v) return default_value;
        std::string s = *v;
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
        if (s == "1" || s == "true" || s == "yes") return true;
        if (s == "0" || s == "false" || s == "no") return false;
        Logger::warning("Ignoring non-boolean value for " + key + ": " + *v, __FILE__, __LINE__);
        return default_value;
    }

} // namespace Keytree
