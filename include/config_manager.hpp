#ifndef CONFIG_MANAGER_HPP
#define CONFIG_MANAGER_HPP

#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

/**
 * @file config_manager.hpp
 * @brief `.env`-style configuration store used by the command-line tool.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    /**
     * @class ConfigManager
     * @brief Loads `KEY=VALUE` lines into a process-wide cache.
     *
     * Blank lines and lines starting with '#' are ignored, as are lines
     * without '='. Keys and values are trimmed. A later duplicate key wins.
     */
    class ConfigManager {
    public:
        /**
         * @brief Replace the cache with the content of @p env_path.
         * @return false if the file could not be opened (the cache is then empty).
         */
        static bool initialize(const std::string& env_path = ".env");

        /// Parse configuration text directly.
        static void loadFromString(const std::string& content);

        static void set(const std::string& key, const std::string& value);
        static void clear();

        static std::optional<std::string> get(const std::string& key);

        /// @throw std::runtime_error If the key is missing.
        static std::string getOrThrow(const std::string& key);

        static std::string getOr(const std::string& key, const std::string& default_value);
        static int getIntOr(const std::string& key, int default_value);
        static bool getBoolOr(const std::string& key, bool default_value);

    private:
        static std::unordered_map<std::string, std::string> cache_;
        static std::mutex mutex_;

        static void parseLines(std::istream& in);
    };

} // namespace Keytree

#endif // CONFIG_MANAGER_HPP
