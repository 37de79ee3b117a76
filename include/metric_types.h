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

#include <map>
#include <string>
#include <vector>

/**
 * @brief Every metric a transcript can be scored on
 *
 * The first five are gated by thresholds. The similarity metrics after them
 * are informational and never carry a threshold.
 */
enum class metric_id {
    tfidf_similarity,
    word_error_rate,
    character_error_rate,
    latency_ms,
    rtf,
    levenshtein_similarity,
    jaccard_similarity
};

/**
 * @brief Which side of a threshold counts as passing
 */
enum class better_direction {
    lower,      ///< pass when value <= threshold
    higher      ///< pass when value >= threshold
};

/// Computed values of one transcript, keyed and ordered by metric_id
using metric_map = std::map<metric_id, double>;

/// All metric ids in report order
const std::vector<metric_id>& all_metrics();

/// Report key, e.g. "word_error_rate"
std::string metric_name(metric_id id);

/// Key in the evaluations mapping, e.g. "wer_passed"
std::string evaluation_key(metric_id id);

/// Key in the thresholds mapping, e.g. "wer_threshold"
std::string threshold_key(metric_id id);

/// Human readable label used by the text report
std::string metric_label(metric_id id);

better_direction default_direction(metric_id id);
