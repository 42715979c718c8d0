#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

/**
 * @file logger.hpp
 * @brief Process-wide leveled logger.
 * @author Keytree Project
 * @date 2026
 *
 * Entries are written synchronously as
 * `YYYY-mm-dd HH:MM:SS [LEVEL] file:line - message`.
 * Until initialize() or initializeStream() is called every entry is dropped,
 * so the library stays silent when embedded in a host that does not opt in.
 */

namespace Keytree {

    enum class LogLevel { DEBUG, INFO, WARNING, ERROR, CRITICAL };

    class Logger {
    public:
        /**
         * @brief Route log entries to a file (opened in append mode).
         * @throw std::runtime_error If the file cannot be opened.
         */
        static void initialize(const std::string& path, LogLevel min_level = LogLevel::INFO);

        /// Route log entries to an existing stream. The stream must outlive the logger.
        static void initializeStream(std::ostream& out, LogLevel min_level = LogLevel::INFO);

        static void shutdown();

        static bool enabled(LogLevel level);

        /// Callers pass __FILE__ and __LINE__; an empty file name omits the location.
        static void log(LogLevel level, const std::string& message, const char* file = "", int line = 0);
        static void debug(const std::string& message, const char* file = "", int line = 0);
        static void info(const std::string& message, const char* file = "", int line = 0);
        static void warning(const std::string& message, const char* file = "", int line = 0);
        static void error(const std::string& message, const char* file = "", int line = 0);
        static void critical(const std::string& message, const char* file = "", int line = 0);

        static std::string levelToString(LogLevel level);

        /**
         * @brief Parse a level name (debug, info, warning, error, critical).
         * @throw std::invalid_argument On an unknown name.
         */
        static LogLevel levelFromString(const std::string& name);

    private:
        static std::mutex mutex_;
        static std::unique_ptr<std::ofstream> file_;
        static std::ostream* out_;
        static LogLevel min_level_;

        static std::string formatEntry(std::chrono::system_clock::time_point tp, LogLevel level,
                                       const std::string& message, const char* file, int line);
    };

} // namespace Keytree

#endif // LOGGER_HPP
