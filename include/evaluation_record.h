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

#include "edit_distance.h"
#include "metric_types.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @struct transcriptor_info
 * @brief Identity of the system that produced the transcripts (opaque, reported as-is)
 */
struct transcriptor_info {
    std::string name = "unknown";
    std::string version = "unknown";
    std::string environment = "unknown";
};

/**
 * @struct threshold
 * @brief A limit and the side of it that passes
 */
struct threshold {
    double limit = 0.0;
    better_direction direction = better_direction::lower;
};

/**
 * @brief Outcome class of one transcript
 */
enum class evaluation_status {
    passed,           ///< every evaluated metric passed
    failed,           ///< at least one evaluated metric failed
    not_evaluable,    ///< no metric had both a value and a threshold
    error             ///< the transcript could not be processed at all
};

std::string status_name(evaluation_status status);

/**
 * @struct evaluation_record
 * @brief Everything known about one hypothesis transcript after evaluation
 */
struct evaluation_record {
    // Identity
    std::string name;                                   ///< Transcript name (file stem)
    std::string gt_path;                                ///< Ground-truth file
    std::string hyp_path;                               ///< Hypothesis file

    // Computed values; metrics that could not be computed are absent
    metric_map metrics;
    std::optional<alignment_result> word_alignment;
    std::optional<alignment_result> character_alignment;

    // Verdict
    std::map<metric_id, bool> evaluations;              ///< Only metrics with value and threshold
    std::map<metric_id, threshold> thresholds;          ///< Thresholds in force for this run
    size_t passed_metrics = 0;
    size_t total_metrics = 0;
    bool overall_passed = false;
    evaluation_status status = evaluation_status::error;

    // Diagnostics
    bool performance_missing = false;                   ///< No usable latency entry
    std::vector<std::string> issues;                    ///< Recovered problems, human readable

    std::optional<transcriptor_info> transcriptor;
};
