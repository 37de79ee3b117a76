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
#include "metric_types.h"
#include <map>
#include <optional>
#include <vector>

/**
 * @brief Documented fallback limits used when a setting is absent or invalid
 */
struct default_thresholds {
    static constexpr double wer = 0.15;
    static constexpr double cer = 0.10;
    static constexpr double tfidf = 0.75;
    static constexpr double latency_ms = 800.0;
    static constexpr double rtf = 0.8;
};

/**
 * @class threshold_set
 * @brief Limits keyed by metric, each with its pass direction
 *
 * Built once per run and then only read, so a single instance can be shared
 * by every worker evaluating transcripts.
 */
class threshold_set {
public:
    threshold_set() = default;

    /**
     * @brief The five gated metrics at their default limits
     */
    static threshold_set defaults();

    /**
     * @brief Set a limit using the metric's natural direction
     */
    void set(metric_id id, double limit);

    void set(metric_id id, double limit, better_direction direction);

    void remove(metric_id id);

    std::optional<threshold> find(metric_id id) const;

    bool contains(metric_id id) const { return m_thresholds.count(id) != 0; }

    bool empty() const { return m_thresholds.empty(); }

    const std::map<metric_id, threshold>& entries() const { return m_thresholds; }

private:
    std::map<metric_id, threshold> m_thresholds;
};

/**
 * @class threshold_evaluator
 * @brief Gates computed metrics against a threshold_set
 *
 * Rules:
 * - lower-is-better passes when value <= limit, higher-is-better when value >= limit
 * - a value exactly at the limit passes in both directions
 * - metrics missing a value or a threshold are skipped; they are neither
 *   passes nor failures and do not count in total_metrics
 * - overall pass requires every evaluated metric to pass (no weighting) and
 *   at least one evaluated metric; zero evaluated metrics is reported as
 *   evaluation_status::not_evaluable rather than a plain failure
 */
class threshold_evaluator {
public:
    explicit threshold_evaluator(const threshold_set& thresholds);

    /**
     * @brief Whether a single value passes a threshold
     */
    static bool passes(double value, const threshold& limit);

    /**
     * @brief Produce a record holding the verdict for a set of metrics
     */
    evaluation_record evaluate(const metric_map& metrics) const;

    /**
     * @brief Fill the verdict fields of a record whose metrics are already set
     *
     * Records in evaluation_status::error keep that status and never pass.
     */
    void evaluate(evaluation_record& record) const;

    const threshold_set& thresholds() const { return m_thresholds; }

    /**
     * @brief Aggregate verdict of a run: true iff there is at least one record and all passed
     */
    static bool all_passed(const std::vector<evaluation_record>& records);

private:
    threshold_set m_thresholds;
};
