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

#include "logger.h"
#include <filesystem>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <fstream>
#include <sstream>
#include <mutex>
#include <algorithm>
#include <cctype>

logger& logger::instance() noexcept {
    static logger instance;
    return instance;
}

logger::~logger() noexcept {
    shutdown();
}

void logger::init(bool enable_file_logging, bool enable_console_logging,
                  const std::string& log_directory) noexcept {
    std::lock_guard<std::mutex> lock(m_mutex);

    try {
        Level previous_level = m_state ? m_state->min_level : Level::INFO;

        if (m_state && m_state->log_file.is_open()) {
            m_state->log_file.close();
        }

        m_state = std::make_unique<loggerState>();
        m_state->file_logging_enabled = enable_file_logging;
        m_state->console_logging_enabled = enable_console_logging;
        m_state->min_level = previous_level;

        if (enable_file_logging) {
            m_state->log_file_name = generate_log_filename(log_directory);
            m_state->log_file.open(m_state->log_file_name, std::ios::out | std::ios::app);

            if (!m_state->log_file.is_open()) {
                if (enable_console_logging) {
                    std::cerr << "Failed to open log file: " << m_state->log_file_name << std::endl;
                }
                m_state->file_logging_enabled = false;
                m_state->log_file_name.clear();
            } else {
                m_state->log_file << "=== tqeval logging started ===" << std::endl;
                m_state->log_file << "Log file: " << m_state->log_file_name << std::endl;
                m_state->log_file << "====" << std::endl << std::endl;
            }
        }
    } catch (...) {
        // Keep console logging alive even if the file could not be set up
        if (m_state) {
            m_state->file_logging_enabled = false;
            m_state->console_logging_enabled = enable_console_logging;
        }
    }
}

std::string logger::generate_log_filename(const std::string& log_directory) noexcept {
    try {
        auto now = std::chrono::system_clock::now();
        auto in_time_t = std::chrono::system_clock::to_time_t(now);

        std::tm tm_buf;
        localtime_r(&in_time_t, &tm_buf);

        std::stringstream ss;
        ss << "tqeval_log_"
           << std::put_time(&tm_buf, "%Y%m%d_%H%M%S")
           << ".log";

        if (log_directory.empty()) {
            return ss.str();
        }
        return (std::filesystem::path(log_directory) / ss.str()).string();
    } catch (...) {
        return "tqeval_log_default.log";
    }
}

std::string logger::level_to_string(Level level) const noexcept {
    switch(level) {
    case Level::DEBUG:   return "DEBUG";
    case Level::INFO:    return "INFO";
    case Level::WARNING: return "WARNING";
    case Level::ERROR:   return "ERROR";
    default:             return "UNKNOWN";
    }
}

std::string logger::current_time() const noexcept {
    try {
        auto now = std::chrono::system_clock::now();
        auto in_time_t = std::chrono::system_clock::to_time_t(now);

        std::tm tm_buf;
        localtime_r(&in_time_t, &tm_buf);

        std::stringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %X");
        return ss.str();
    } catch (...) {
        return "[TIME_ERROR]";
    }
}

void logger::log(Level level, const std::string& message,
                 const std::string& file, int line) noexcept {
    std::lock_guard<std::mutex> lock(m_mutex);

    try {
        if (!m_state || level < m_state->min_level) return;

        std::stringstream log_entry;
        log_entry << "[" << current_time() << "] "
                  << "[" << level_to_string(level) << "] ";

        if (!file.empty() && line != -1) {
            try {
                log_entry << "[" << std::filesystem::path(file).filename().string()
                          << ":" << line << "] ";
            } catch (...) {
                log_entry << "[" << file << ":" << line << "] ";
            }
        }

        log_entry << message;

        const std::string final_message = log_entry.str();

        if (m_state->console_logging_enabled) {
            try {
                std::cerr << final_message << std::endl;
            } catch (...) {
                // Console is gone, the file may still work
            }
        }

        if (m_state->file_logging_enabled && m_state->log_file.is_open()) {
            try {
                m_state->log_file << final_message << std::endl;
            } catch (...) {
                m_state->file_logging_enabled = false;
                if (m_state->log_file.is_open()) {
                    m_state->log_file.close();
                }
            }
        }
    } catch (...) {
        try {
            std::cerr << "[LOGGER_ERROR] Failed to log message" << std::endl;
        } catch (...) {
        }
    }
}

void logger::log_section(const std::string& title,
                         const std::vector<std::string>& messages,
                         Level level) noexcept {
    try {
        if (level < get_min_level()) return;

        log(level, "==== " + title + " ====");
        for (const auto& msg : messages) {
            log(level, "  " + msg);
        }
        log(level, "=====================================");
    } catch (...) {
        log(Level::ERROR, "Failed to log section: " + title);
    }
}

void logger::set_min_level(Level level) noexcept {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state) {
        m_state->min_level = level;
    }
}

logger::Level logger::get_min_level() const noexcept {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state ? m_state->min_level : Level::INFO;
}

std::string logger::get_log_file_name() const noexcept {
    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        return m_state ? m_state->log_file_name : "";
    } catch (...) {
        return "";
    }
}

void logger::flush() noexcept {
    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        if (m_state && m_state->file_logging_enabled && m_state->log_file.is_open()) {
            m_state->log_file.flush();
        }
    } catch (...) {
        // Ignore flush errors
    }
}

void logger::shutdown() noexcept {
    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        if (m_state) {
            if (m_state->file_logging_enabled && m_state->log_file.is_open()) {
                try {
                    m_state->log_file << std::endl << "=== tqeval logging ended ===" << std::endl;
                    m_state->log_file.close();
                } catch (...) {
                    // Ignore errors during shutdown
                }
            }
            m_state.reset();
        }
    } catch (...) {
        // Ignore all errors during shutdown
    }
}

logger::Level logger::parse_level(const std::string& name, Level fallback) noexcept {
    try {
        std::string lowered = name;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lowered == "debug") return Level::DEBUG;
        if (lowered == "info") return Level::INFO;
        if (lowered == "warning" || lowered == "warn") return Level::WARNING;
        if (lowered == "error") return Level::ERROR;
        return fallback;
    } catch (...) {
        return fallback;
    }
}

std::string logger::truncate_text(const std::string& text, size_t max_length) noexcept {
    try {
        return text.length() > max_length ? text.substr(0, max_length) + "..." : text;
    } catch (...) {
        return "[TEXT_ERROR]";
    }
}

std::string logger::get_json_keys(const nlohmann::json& j) noexcept {
    try {
        if (!j.is_object()) {
            return "(not an object)";
        }
        std::string keys;
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (!keys.empty()) keys += ", ";
            keys += it.key();
        }
        return keys.empty() ? "(none)" : keys;
    } catch (...) {
        return "[JSON_ERROR]";
    }
}
