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

#include "error_rate_calculator.h"
#include "eval_errors.h"

error_rate_calculator::error_rate_calculator()
    : m_normalizer() {
}

error_rate_calculator::error_rate_calculator(const text_normalizer& normalizer)
    : m_normalizer(normalizer) {
}

error_rate_calculator::error_rate
error_rate_calculator::word_error_rate(const std::string& reference,
                                       const std::string& hypothesis) const {
    return compute(m_normalizer.words(reference), m_normalizer.words(hypothesis));
}

error_rate_calculator::error_rate
error_rate_calculator::character_error_rate(const std::string& reference,
                                            const std::string& hypothesis) const {
    return compute(m_normalizer.characters(reference), m_normalizer.characters(hypothesis));
}

error_rate_calculator::error_rate
error_rate_calculator::compute(const std::vector<std::string>& reference,
                               const std::vector<std::string>& hypothesis) {
    error_rate result;
    result.alignment = edit_distance::align(reference, hypothesis);
    result.rate = rate(result.alignment);
    return result;
}

double error_rate_calculator::rate(const alignment_result& alignment) {
    if (alignment.reference_length == 0) {
        throw undefined_metric_error("Error rate is undefined for an empty reference (" +
                                     std::to_string(alignment.hypothesis_length) +
                                     " hypothesis units)");
    }
    return static_cast<double>(alignment.errors()) /
           static_cast<double>(alignment.reference_length);
}
