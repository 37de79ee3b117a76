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

#include "evaluation_record.h"
#include "threshold_evaluator.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

using json = nlohmann::json;

/**
 * @class report_writer
 * @brief Serializes evaluation records as a JSON report or a console text report
 *
 * Output is deterministic: the same records always produce the same bytes.
 */
class report_writer {
public:
    /**
     * @brief Counters over a run
     */
    struct summary {
        size_t total = 0;
        size_t passed = 0;
        size_t failed = 0;
        size_t not_evaluable = 0;
        size_t errors = 0;
        bool all_passed = false;
    };

    explicit report_writer(const threshold_set& thresholds,
                           std::optional<transcriptor_info> transcriptor = std::nullopt);

    /**
     * @brief One record in the structured shape consumed by reporting tools
     *
     * Keys: name, gt_path, hyp_path, metrics, evaluations, thresholds,
     * passed_metrics, total_metrics, overall_passed, status, issues,
     * performance_missing, word_alignment / character_alignment when
     * computed, and transcriptor when known.
     */
    static json record_to_json(const evaluation_record& record);

    static json transcriptor_to_json(const transcriptor_info& transcriptor);

    static json thresholds_to_json(const std::map<metric_id, threshold>& thresholds);

    static summary summarize(const std::vector<evaluation_record>& records);

    /**
     * @brief Whole report: generated_by, transcriptor, thresholds, records and summary
     */
    json to_json(const std::vector<evaluation_record>& records) const;

    /**
     * @brief Human readable report, one block per transcript
     */
    std::string to_text(const std::vector<evaluation_record>& records) const;

    /**
     * @brief Write the report in the given format ("json" or "txt")
     * @throws std::invalid_argument for an unknown format
     */
    void write(const std::vector<evaluation_record>& records,
               std::ostream& out,
               const std::string& format) const;

    /**
     * @brief Write the report to a file
     * @throws std::runtime_error if the file cannot be opened
     */
    void export_results(const std::vector<evaluation_record>& records,
                        const std::string& output_path,
                        const std::string& format) const;

    /// Metric value with 3 decimals, or "N/A"
    static std::string format_value(const evaluation_record& record, metric_id id);

private:
    threshold_set m_thresholds;
    std::optional<transcriptor_info> m_transcriptor;

    void format_record(const evaluation_record& record, std::ostream& out) const;
};
