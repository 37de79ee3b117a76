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

#include <cstddef>
#include <string>
#include <vector>

/**
 * @struct alignment_result
 * @brief Edit operation counts turning a reference sequence into a hypothesis
 */
struct alignment_result {
    size_t substitutions = 0;
    size_t insertions = 0;
    size_t deletions = 0;
    size_t reference_length = 0;
    size_t hypothesis_length = 0;

    /// Total edit operations (S + I + D)
    size_t errors() const { return substitutions + insertions + deletions; }

    bool operator==(const alignment_result& other) const {
        return substitutions == other.substitutions && insertions == other.insertions &&
               deletions == other.deletions && reference_length == other.reference_length &&
               hypothesis_length == other.hypothesis_length;
    }
    bool operator!=(const alignment_result& other) const { return !(*this == other); }
};

/**
 * @class edit_distance
 * @brief Unit-cost Levenshtein alignment over token or character sequences
 *
 * Classic dynamic programming with two rolling rows; each cell carries the
 * (S, I, D) counts of the best path reaching it, so no backtracking table is
 * kept. Time O(m*n), memory O(n) for a hypothesis of length n.
 *
 * Tie-breaking among equal-cost moves is fixed:
 *   match > substitution > deletion > insertion
 * so identical input always yields identical counts.
 */
class edit_distance {
public:
    /**
     * @brief Align a hypothesis against a reference
     * @param reference Reference sequence R (length m)
     * @param hypothesis Hypothesis sequence H (length n)
     * @return Counts of the minimum-cost alignment
     *
     * R empty gives n insertions, H empty gives m deletions.
     */
    static alignment_result align(const std::vector<std::string>& reference,
                                  const std::vector<std::string>& hypothesis);

    /**
     * @brief Minimum number of edit operations between two sequences
     */
    static size_t distance(const std::vector<std::string>& reference,
                           const std::vector<std::string>& hypothesis);
};
