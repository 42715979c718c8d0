#include "../include/logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <sstream>
#include <stdexcept>

/**
 * @file logger.cpp
 * @brief Implementation of the process-wide logger.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    std::mutex Logger::mutex_;
    std::unique_ptr<std::ofstream> Logger::file_;
    std::ostream* Logger::out_ = nullptr;
    LogLevel Logger::min_level_ = LogLevel::INFO;

    namespace {

        std::string nowToString(const std::chrono::system_clock::time_point& tp) {
            std::time_t t = std::chrono::system_clock::to_time_t(tp);
            std::tm tm_buf;
#if defined(_WIN32)
            localtime_s(&tm_buf, &t);
#else
            localtime_r(&t, &tm_buf);
#endif
            char buf[64];
            std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
            return std::string(buf);
        }

        // Keep only the file name, build trees make __FILE__ long.
        const char* baseName(const char* path) {
            const char* base = path;
            for (const char* p = path; *p; ++p) {
                if (*p == '/' || *p == '\\') base = p + 1;
            }
            return base;
        }
    }

    void Logger::initialize(const std::string& path, LogLevel min_level) {
        auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app);
        if (!file->is_open()) {
            throw std::runtime_error("Unable to open log file: " + path);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        file_ = std::move(file);
        out_ = file_.get();
        min_level_ = min_level;
    }

    void Logger::initializeStream(std::ostream& out, LogLevel min_level) {
        std::lock_guard<std::mutex> lock(mutex_);
        file_.reset();
        out_ = &out;
        min_level_ = min_level;
    }

    void Logger::shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (out_) out_->flush();
        out_ = nullptr;
        file_.reset();
    }

    bool Logger::enabled(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        return out_ != nullptr && level >= min_level_;
    }

    void Logger::log(LogLevel level, const std::string& message, const char* file, int line) {
        auto now = std::chrono::system_clock::now();

        std::lock_guard<std::mutex> lock(mutex_);
        if (!out_ || level < min_level_) return;

        *out_ << formatEntry(now, level, message, file, line);
        out_->flush();
    }

    void Logger::debug(const std::string& message, const char* file, int line) {
        log(LogLevel::DEBUG, message, file, line);
    }

    void Logger::info(const std::string& message, const char* file, int line) {
        log(LogLevel::INFO, message, file, line);
    }

    void Logger::warning(const std::string& message, const char* file, int line) {
        log(LogLevel::WARNING, message, file, line);
    }

    void Logger::error(const std::string& message, const char* file, int line) {
        log(LogLevel::ERROR, message, file, line);
    }

    void Logger::critical(const std::string& message, const char* file, int line) {
        log(LogLevel::CRITICAL, message, file, line);
    }

    std::string Logger::levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARNING: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::CRITICAL: return "CRIT";
        }
        return "UNK";
    }

    LogLevel Logger::levelFromString(const std::string& name) {
        std::string s = name;
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });

        if (s == "debug") return LogLevel::DEBUG;
        if (s == "info") return LogLevel::INFO;
        if (s == "warning" || s == "warn") return LogLevel::WARNING;
        if (s == "error") return LogLevel::ERROR;
        if (s == "critical" || s == "crit") return LogLevel::CRITICAL;

        throw std::invalid_argument("Unknown log level: " + name);
    }

    std::string Logger::formatEntry(std::chrono::system_clock::time_point tp, LogLevel level,
                                    const std::string& message, const char* file, int line) {
        std::ostringstream oss;
        oss << nowToString(tp) << " [" << levelToString(level) << "] ";
        if (file && *file) {
            oss << baseName(file) << ":" << line << " ";
        }
        oss << "- " << message << '\n';
        return oss.str();
    }

} // namespace Keytree
