// -------------------------------------------------------------------------------------------------
//
// Copyright (C) all of the contributors. All rights reserved.
//
// This software, including documentation, is protected by copyright controlled by
// contributors. All rights are reserved. Copying, including reproducing, storing,
// adapting or translating, any or all of this material requires the prior written
// consent of all contributors.
//
// -------------------------------------------------------------------------------------------------

#ifndef TQEVAL_LOGGER_H
#define TQEVAL_LOGGER_H

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <memory>
#include <fstream>
#include <mutex>

/**
 * @brief Thread-safe singleton logger used by every tqeval component
 *
 * Features:
 * - Mutex protected, so transcripts evaluated on worker threads can log freely
 * - noexcept interface, logging never interrupts an evaluation
 * - Console output on stderr (stdout is reserved for the report)
 * - Optional timestamped log file in a configurable directory
 * - Section-based logging for the run banner and threshold listing
 */
class logger {
public:
    /**
     * @brief Log severity levels in ascending order of importance
     */
    enum class Level {
        DEBUG,
        INFO,
        WARNING,
        ERROR
    };

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;
    logger(logger&&) = delete;
    logger& operator=(logger&&) = delete;

    /**
     * @brief Get the singleton instance of the logger
     */
    static logger& instance() noexcept;

    /**
     * @brief Initialize (or reinitialize) the logging system
     * @param enable_file_logging Write to a tqeval_log_YYYYMMDD_HHMMSS.log file
     * @param enable_console_logging Write to stderr
     * @param log_directory Directory for the log file (default: current directory)
     */
    void init(bool enable_file_logging = false,
              bool enable_console_logging = true,
              const std::string& log_directory = "") noexcept;

    /**
     * @brief Core logging function
     * @param level Log level for this message
     * @param message The message to log
     * @param file Source file name (used by macros)
     * @param line Source line number (used by macros)
     * @note Messages below the minimum log level are dropped
     */
    void log(Level level, const std::string& message,
             const std::string& file = "", int line = -1) noexcept;

    /**
     * @brief Log a titled section with multiple messages
     */
    void log_section(const std::string& title,
                     const std::vector<std::string>& messages,
                     Level level = Level::INFO) noexcept;

    void set_min_level(Level level) noexcept;

    Level get_min_level() const noexcept;

    /**
     * @brief Get the current log file name, empty if file logging is disabled
     */
    std::string get_log_file_name() const noexcept;

    void flush() noexcept;

    /**
     * @brief Close the log file and drop all state. Safe to call multiple times.
     */
    void shutdown() noexcept;

    /**
     * @brief Parse a level name ("debug", "info", "warning"/"warn", "error"), case-insensitive
     * @param name Level name
     * @param fallback Level returned when the name is not recognised
     */
    static Level parse_level(const std::string& name, Level fallback = Level::INFO) noexcept;

    static std::string truncate_text(const std::string& text, size_t max_length = 100) noexcept;

    /**
     * @brief Comma-separated keys of a JSON object, "(none)" if empty
     */
    static std::string get_json_keys(const nlohmann::json& j) noexcept;

private:
    logger() = default;
    ~logger() noexcept;

    struct loggerState {
        bool file_logging_enabled = false;      ///< File logging enabled flag
        bool console_logging_enabled = true;    ///< Console logging enabled flag
        Level min_level = Level::INFO;          ///< Minimum log level filter
        std::ofstream log_file;                 ///< Output file stream
        std::string log_file_name;              ///< Current log file name
    };

    std::unique_ptr<loggerState> m_state;
    mutable std::mutex m_mutex;

    /**
     * @brief Generate "tqeval_log_YYYYMMDD_HHMMSS.log" inside the given directory
     */
    std::string generate_log_filename(const std::string& log_directory) noexcept;

    std::string level_to_string(Level level) const noexcept;

    std::string current_time() const noexcept;
};

/**
 * @brief Convenience macros capturing __FILE__ and __LINE__
 *
 *   LOG_INFO("Evaluating " + name);
 *   LOG_WARNING("Invalid value for WER_THRESHOLD, falling back to default");
 */
#define LOG_DEBUG(msg) logger::instance().log(logger::Level::DEBUG, msg, __FILE__, __LINE__)
#define LOG_INFO(msg) logger::instance().log(logger::Level::INFO, msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) logger::instance().log(logger::Level::WARNING, msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) logger::instance().log(logger::Level::ERROR, msg, __FILE__, __LINE__)

#endif // TQEVAL_LOGGER_H
