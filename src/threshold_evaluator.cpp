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

#include "threshold_evaluator.h"
#include "logger.h"
#include <stdexcept>

std::string status_name(evaluation_status status) {
    switch (status) {
    case evaluation_status::passed:        return "passed";
    case evaluation_status::failed:        return "failed";
    case evaluation_status::not_evaluable: return "not_evaluable";
    case evaluation_status::error:         return "error";
    }
    throw std::invalid_argument("Unknown evaluation status");
}

threshold_set threshold_set::defaults() {
    threshold_set thresholds;
    thresholds.set(metric_id::word_error_rate, default_thresholds::wer);
    thresholds.set(metric_id::character_error_rate, default_thresholds::cer);
    thresholds.set(metric_id::tfidf_similarity, default_thresholds::tfidf);
    thresholds.set(metric_id::latency_ms, default_thresholds::latency_ms);
    thresholds.set(metric_id::rtf, default_thresholds::rtf);
    return thresholds;
}

void threshold_set::set(metric_id id, double limit) {
    set(id, limit, default_direction(id));
}

void threshold_set::set(metric_id id, double limit, better_direction direction) {
    threshold entry;
    entry.limit = limit;
    entry.direction = direction;
    m_thresholds[id] = entry;
}

void threshold_set::remove(metric_id id) {
    m_thresholds.erase(id);
}

std::optional<threshold> threshold_set::find(metric_id id) const {
    auto it = m_thresholds.find(id);
    if (it == m_thresholds.end()) {
        return std::nullopt;
    }
    return it->second;
}

threshold_evaluator::threshold_evaluator(const threshold_set& thresholds)
    : m_thresholds(thresholds) {
}

bool threshold_evaluator::passes(double value, const threshold& limit) {
    if (limit.direction == better_direction::lower) {
        return value <= limit.limit;
    }
    return value >= limit.limit;
}

evaluation_record threshold_evaluator::evaluate(const metric_map& metrics) const {
    evaluation_record record;
    record.metrics = metrics;
    record.status = evaluation_status::passed;
    evaluate(record);
    return record;
}

void threshold_evaluator::evaluate(evaluation_record& record) const {
    record.thresholds = m_thresholds.entries();
    record.evaluations.clear();
    record.passed_metrics = 0;
    record.total_metrics = 0;
    record.overall_passed = false;

    if (record.status == evaluation_status::error) {
        return;
    }

    for (const auto& entry : m_thresholds.entries()) {
        auto value = record.metrics.find(entry.first);
        if (value == record.metrics.end()) {
            continue;
        }

        const bool ok = passes(value->second, entry.second);
        record.evaluations[entry.first] = ok;
        record.total_metrics++;
        if (ok) {
            record.passed_metrics++;
        }
    }

    if (record.total_metrics == 0) {
        record.status = evaluation_status::not_evaluable;
        record.issues.push_back("No metric could be evaluated: every computed metric lacks a "
                                "threshold or every threshold lacks a value");
        LOG_WARNING("Transcript '" + record.name + "' has no evaluable metrics");
        return;
    }

    record.overall_passed = record.passed_metrics == record.total_metrics;
    record.status = record.overall_passed ? evaluation_status::passed : evaluation_status::failed;
}

bool threshold_evaluator::all_passed(const std::vector<evaluation_record>& records) {
    if (records.empty()) {
        return false;
    }
    for (const auto& record : records) {
        if (!record.overall_passed) {
            return false;
        }
    }
    return true;
}
