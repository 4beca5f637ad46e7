// include/ta_ngin/core/logger.hpp
#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include "ta_ngin/core/config_base.hpp"

namespace ta_ngin {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Per-indicator detail
    DEBUG,    // Composition steps
    INFO,     // General information
    WARNING,  // Recoverable problems
    ERR,      // Failed operations
    FATAL     // Unrecoverable errors
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,
    FILE,
    BOTH
};

std::string level_to_string(LogLevel level);
std::optional<LogLevel> level_from_string(const std::string& text);
std::string log_destination_to_string(LogDestination dest);
std::optional<LogDestination> log_destination_from_string(const std::string& text);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"ta_ngin"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{10 * 1024 * 1024};  // 10MB per part
    size_t max_files{5};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Thread-safe process-wide logger
 *
 * Console output goes to std::cout; file output is split into parts named
 * prefix_YYYYMMDD_HHMMSS_partN.log and rotated once a part exceeds
 * max_file_size, keeping at most max_files files in the directory.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @throws std::runtime_error if the log directory or file cannot be opened
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Reset the logger for testing
     */
    static void reset_for_tests();

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
    }

    LogLevel get_min_level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_.min_level;
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag subsequent messages from the calling thread with a component name
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void open_part_unsafe();
    void enforce_retention_unsafe();
    void write_unsafe(const std::string& formatted);
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    static thread_local std::string current_component_;

    std::string session_timestamp_;  // YYYYMMDD_HHMMSS
    int part_number_{1};
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Message: " << variable)
 */
#define LOG(level, message)                                                      \
    do {                                                                         \
        if (level >= ::ta_ngin::Logger::instance().get_min_level()) {            \
            std::ostringstream os;                                               \
            os << message;                                                       \
            ::ta_ngin::Logger::instance().log(level, os.str());                  \
        }                                                                        \
    } while (0)

#define TRACE(message) LOG(::ta_ngin::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::ta_ngin::LogLevel::DEBUG, message)
#define INFO(message) LOG(::ta_ngin::LogLevel::INFO, message)
#define WARN(message) LOG(::ta_ngin::LogLevel::WARNING, message)
#define ERROR(message) LOG(::ta_ngin::LogLevel::ERR, message)
#define FATAL(message) LOG(::ta_ngin::LogLevel::FATAL, message)

}  // namespace ta_ngin
