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
#include "performance_aggregator.h"
#include "similarity_engine.h"
#include "text_normalizer.h"
#include "threshold_evaluator.h"
#include "transcript_source.h"
#include <optional>
#include <string>
#include <vector>

/**
 * @struct transcript_input
 * @brief A hypothesis already loaded into memory
 */
struct transcript_input {
    std::string name;
    std::string gt_path;
    std::string hyp_path;       ///< Its file name is the latency map key; falls back to name
    std::string text;
};

/**
 * @class evaluation_pipeline
 * @brief Turns (reference, hypotheses, latency map, thresholds) into evaluation_records
 *
 * The reference is normalized once. Each hypothesis is then scored independently:
 *
 * ```
 * hypothesis ─► normalizer ─┬─► edit distance ─► WER, CER
 *                           ├─► similarity    ─► TF-IDF (+ Levenshtein, Jaccard)
 * latency map ─► aggregator ┴─► latency, RTF
 *                                   │
 *                     threshold_evaluator ─► evaluation_record
 * ```
 *
 * Recovered problems never abort a transcript; they become entries in
 * evaluation_record::issues. With jobs > 1 transcripts are spread over worker
 * threads; records always come back in input order and are identical to a
 * sequential run.
 */
class evaluation_pipeline {
public:
    /**
     * @param normalizer Shared canonicalization for every metric
     * @param thresholds Limits in force for the whole run
     * @param performance Latency map (may be empty)
     * @param transcriptor Identity attached to every record, if any
     * @param similarity TF-IDF tokenization options
     */
    evaluation_pipeline(const text_normalizer& normalizer,
                        const threshold_set& thresholds,
                        const performance_aggregator& performance,
                        std::optional<transcriptor_info> transcriptor = std::nullopt,
                        const similarity_engine::config& similarity = similarity_engine::config());

    /**
     * @brief Evaluate one hypothesis
     */
    evaluation_record evaluate(const std::string& reference, const transcript_input& hypothesis) const;

    /**
     * @brief Evaluate many hypotheses against one reference
     * @param jobs Worker threads (values below 1 mean 1)
     */
    std::vector<evaluation_record> evaluate_all(const std::string& reference,
                                                const std::vector<transcript_input>& hypotheses,
                                                int jobs = 1) const;

    /**
     * @brief Read and evaluate discovered files
     *
     * An unreadable hypothesis yields a record in evaluation_status::error.
     * @throws missing_reference_error if the ground truth cannot be read
     */
    std::vector<evaluation_record> evaluate_files(const std::vector<transcript_pair>& pairs,
                                                  int jobs = 1) const;

    const threshold_set& thresholds() const { return m_evaluator.thresholds(); }

private:
    /// Normalized views of the reference, computed once per run
    struct reference_view {
        std::vector<std::string> words;
        std::vector<std::string> characters;
    };

    reference_view prepare_reference(const std::string& reference) const;

    evaluation_record evaluate_prepared(const reference_view& reference,
                                        const transcript_input& hypothesis) const;

    void attach_text_metrics(const reference_view& reference,
                             const std::string& hypothesis,
                             evaluation_record& record) const;

    void attach_performance(const transcript_input& hypothesis, evaluation_record& record) const;

    evaluation_record error_record(const transcript_input& hypothesis, const std::string& message) const;

    text_normalizer m_normalizer;
    similarity_engine m_similarity;
    threshold_evaluator m_evaluator;
    performance_aggregator m_performance;
    std::optional<transcriptor_info> m_transcriptor;
};
