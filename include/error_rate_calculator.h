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
#include "text_normalizer.h"
#include <string>
#include <vector>

/**
 * @class error_rate_calculator
 * @brief Word and character error rates from edit-distance alignments
 *
 * rate = (S + I + D) / reference_length, with no upper bound (insertions can
 * push it above 1.0). An empty reference has no defined rate: every method
 * throws undefined_metric_error in that case and the caller reports the
 * metric as not evaluated.
 */
class error_rate_calculator {
public:
    /**
     * @struct error_rate
     * @brief A rate together with the alignment it was derived from
     */
    struct error_rate {
        double rate = 0.0;
        alignment_result alignment;
    };

    error_rate_calculator();

    explicit error_rate_calculator(const text_normalizer& normalizer);

    /**
     * @brief WER over normalized word tokens
     * @throws undefined_metric_error if the reference has no tokens
     */
    error_rate word_error_rate(const std::string& reference, const std::string& hypothesis) const;

    /**
     * @brief CER over normalized code points, spaces included
     * @throws undefined_metric_error if the reference has no characters
     */
    error_rate character_error_rate(const std::string& reference, const std::string& hypothesis) const;

    /**
     * @brief Align two prepared sequences and derive the rate
     * @throws undefined_metric_error if reference is empty
     */
    static error_rate compute(const std::vector<std::string>& reference,
                              const std::vector<std::string>& hypothesis);

    /**
     * @brief (S + I + D) / L for an existing alignment
     * @throws undefined_metric_error if L == 0
     */
    static double rate(const alignment_result& alignment);

private:
    text_normalizer m_normalizer;
};
