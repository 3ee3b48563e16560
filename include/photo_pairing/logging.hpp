#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace photo_pairing::logging {

    /**
     * @brief Severity levels, lowest first
     */
    enum class LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARNING = 2,
        ERROR = 3
    };

    inline std::atomic<int>& minimumLevel() {
        static std::atomic<int> level{static_cast<int>(LogLevel::INFO)};
        return level;
    }

    inline void setLevel(LogLevel level) {
        minimumLevel().store(static_cast<int>(level));
    }

    inline bool isEnabled(LogLevel level) {
        return static_cast<int>(level) >= minimumLevel().load();
    }

    /**
     * @brief Parse a level name ("debug", "info", "warning", "error")
     * @return true if the name was recognized and @p level was set
     */
    inline bool levelFromString(std::string name, LogLevel& level) {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == "debug") { level = LogLevel::DEBUG; return true; }
        if (name == "info") { level = LogLevel::INFO; return true; }
        if (name == "warning" || name == "warn") { level = LogLevel::WARNING; return true; }
        if (name == "error") { level = LogLevel::ERROR; return true; }
        return false;
    }

    inline const char* toString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARNING: return "WARNING";
            case LogLevel::ERROR: return "ERROR";
            default: return "UNKNOWN";
        }
    }

    inline std::mutex& outputMutex() {
        static std::mutex mutex;
        return mutex;
    }

    inline std::string currentTimestamp() {
        const auto now = std::chrono::system_clock::now();
        const auto time = std::chrono::system_clock::to_time_t(now);
        std::tm local_tm{};
        localtime_r(&time, &local_tm);
        std::ostringstream ss;
        ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    // INFO and DEBUG go to stdout, WARNING and ERROR to stderr
    inline void write(LogLevel level, const std::string& message) {
        if (!isEnabled(level)) {
            return;
        }
        const std::string line = currentTimestamp() + " [" + toString(level) + "] " + message;
        std::lock_guard<std::mutex> lock(outputMutex());
        if (level >= LogLevel::WARNING) {
            std::cerr << line << std::endl;
        } else {
            std::cout << line << std::endl;
        }
    }

} // namespace photo_pairing::logging

#define LOG_DEBUG(message) ::photo_pairing::logging::write(::photo_pairing::logging::LogLevel::DEBUG, (message))
#define LOG_INFO(message) ::photo_pairing::logging::write(::photo_pairing::logging::LogLevel::INFO, (message))
#define LOG_WARNING(message) ::photo_pairing::logging::write(::photo_pairing::logging::LogLevel::WARNING, (message))
#define LOG_ERROR(message) ::photo_pairing::logging::write(::photo_pairing::logging::LogLevel::ERROR, (message))
