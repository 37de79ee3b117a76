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

#include "performance_aggregator.h"
#include <string>
#include <vector>

/**
 * @struct transcript_pair
 * @brief One hypothesis to evaluate against the ground truth
 */
struct transcript_pair {
    std::string name;       ///< File stem, e.g. "transcript1"
    std::string gt_path;    ///< Ground-truth file
    std::string hyp_path;   ///< Hypothesis file
};

/**
 * @class transcript_source
 * @brief Discovers transcripts and their latency metadata on disk
 *
 * @par Expected layout:
 * ```
 * texts/
 *   gt/reference.txt        exactly one .txt ground truth
 *   transcript1.txt         every .txt here is a hypothesis
 *   transcript2.txt
 *   latency.json            optional, keyed by hypothesis file name
 * ```
 */
class transcript_source {
public:
    explicit transcript_source(const std::string& texts_dir);

    /**
     * @brief Path of the single ground-truth file
     * @throws missing_reference_error if gt/ is missing or holds zero or several .txt files
     */
    std::string find_ground_truth() const;

    /**
     * @brief Hypothesis files sorted by file name
     * @throws discovery_error if the directory is missing or has no .txt file
     */
    std::vector<std::string> find_hypotheses() const;

    /**
     * @brief Ground truth paired with every hypothesis, in discovery order
     * @throws missing_reference_error, discovery_error
     */
    std::vector<transcript_pair> scan() const;

    /**
     * @brief Load the latency map
     * @param path Explicit path; empty means <texts_dir>/latency.json
     *
     * A missing or unparseable file yields an empty aggregator (logged).
     */
    performance_aggregator load_latency_map(const std::string& path = "") const;

    std::string default_latency_path() const;

    const std::string& texts_dir() const { return m_texts_dir; }

    /**
     * @brief Read a UTF-8 text file, dropping a BOM and surrounding whitespace
     * @throws std::runtime_error if the file cannot be opened
     */
    static std::string read_text_file(const std::string& path);

private:
    std::string m_texts_dir;
};
