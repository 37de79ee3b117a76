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

#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <variant>

/**
 * @brief Latency entry given as a bare number of milliseconds
 */
struct numeric_latency {
    double latency_ms = 0.0;
};

/**
 * @brief Latency entry given as {"latency_ms": ..., "rtf": ...}
 */
struct detailed_latency {
    double latency_ms = 0.0;
    std::optional<double> rtf;
};

/// One raw latency entry, either shape
using latency_metadata = std::variant<numeric_latency, detailed_latency>;

/**
 * @struct performance_record
 * @brief Normalized performance data of one transcript
 *
 * rtf is empty when the entry did not carry one; it is never derived from
 * latency because the audio duration is unknown here.
 */
struct performance_record {
    double latency_ms = 0.0;
    std::optional<double> rtf;
};

/**
 * @class performance_aggregator
 * @brief Resolves per-transcript latency metadata into performance_records
 *
 * The latency map is a JSON object keyed by hypothesis file name:
 * @code
 * {
 *   "transcript1.txt": 650,
 *   "transcript2.txt": {"latency_ms": 720.5, "rtf": 0.42},
 *   "transcript3.txt": {"latency_ms": "810"}
 * }
 * @endcode
 *
 * Numbers may also be given as numeric strings. Negative or non-finite
 * values, a missing latency_ms, or any other shape make the entry invalid.
 * Invalid entries are remembered with their reason so that lookup() can
 * report them per transcript.
 */
class performance_aggregator {
public:
    performance_aggregator() = default;

    /**
     * @brief Build from already-resolved entries
     */
    explicit performance_aggregator(std::map<std::string, latency_metadata> entries);

    /**
     * @brief Build from a parsed latency map
     *
     * A non-object root is logged and produces an empty aggregator.
     */
    static performance_aggregator from_json(const nlohmann::json& root);

    /**
     * @brief Interpret one JSON entry
     * @throws missing_performance_data if the entry is unusable
     */
    static latency_metadata parse_metadata(const nlohmann::json& entry);

    /**
     * @brief Collapse either metadata shape into (latency_ms, optional rtf)
     */
    static performance_record normalize(const latency_metadata& metadata);

    /**
     * @brief Performance data of one transcript
     * @param file_name Hypothesis file name (e.g. "transcript1.txt")
     * @throws missing_performance_data if there is no valid entry for it
     */
    performance_record lookup(const std::string& file_name) const;

    bool contains(const std::string& file_name) const;

    /// Number of valid entries
    size_t size() const { return m_entries.size(); }

    /// Number of entries rejected while parsing
    size_t invalid_count() const { return m_invalid.size(); }

private:
    std::map<std::string, latency_metadata> m_entries;
    std::map<std::string, std::string> m_invalid;    ///< file name -> rejection reason
};
