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

#include "metric_types.h"
#include <stdexcept>

const std::vector<metric_id>& all_metrics() {
    static const std::vector<metric_id> metrics = {
        metric_id::tfidf_similarity,
        metric_id::word_error_rate,
        metric_id::character_error_rate,
        metric_id::latency_ms,
        metric_id::rtf,
        metric_id::levenshtein_similarity,
        metric_id::jaccard_similarity
    };
    return metrics;
}

std::string metric_name(metric_id id) {
    switch (id) {
    case metric_id::tfidf_similarity:       return "tfidf_similarity";
    case metric_id::word_error_rate:        return "word_error_rate";
    case metric_id::character_error_rate:   return "character_error_rate";
    case metric_id::latency_ms:             return "latency_ms";
    case metric_id::rtf:                    return "rtf";
    case metric_id::levenshtein_similarity: return "levenshtein_similarity";
    case metric_id::jaccard_similarity:     return "jaccard_similarity";
    }
    throw std::invalid_argument("Unknown metric id");
}

std::string evaluation_key(metric_id id) {
    switch (id) {
    case metric_id::tfidf_similarity:       return "tfidf_passed";
    case metric_id::word_error_rate:        return "wer_passed";
    case metric_id::character_error_rate:   return "cer_passed";
    case metric_id::latency_ms:             return "latency_passed";
    case metric_id::rtf:                    return "rtf_passed";
    case metric_id::levenshtein_similarity: return "levenshtein_passed";
    case metric_id::jaccard_similarity:     return "jaccard_passed";
    }
    throw std::invalid_argument("Unknown metric id");
}

std::string threshold_key(metric_id id) {
    switch (id) {
    case metric_id::tfidf_similarity:       return "tfidf_threshold";
    case metric_id::word_error_rate:        return "wer_threshold";
    case metric_id::character_error_rate:   return "cer_threshold";
    case metric_id::latency_ms:             return "latency_threshold_ms";
    case metric_id::rtf:                    return "rtf_threshold";
    case metric_id::levenshtein_similarity: return "levenshtein_threshold";
    case metric_id::jaccard_similarity:     return "jaccard_threshold";
    }
    throw std::invalid_argument("Unknown metric id");
}

std::string metric_label(metric_id id) {
    switch (id) {
    case metric_id::tfidf_similarity:       return "TF-IDF Similarity:";
    case metric_id::word_error_rate:        return "Word Error Rate:";
    case metric_id::character_error_rate:   return "Character Error Rate:";
    case metric_id::latency_ms:             return "Latency (ms):";
    case metric_id::rtf:                    return "Real-Time Factor:";
    case metric_id::levenshtein_similarity: return "Levenshtein Similarity:";
    case metric_id::jaccard_similarity:     return "Jaccard Similarity:";
    }
    throw std::invalid_argument("Unknown metric id");
}

better_direction default_direction(metric_id id) {
    switch (id) {
    case metric_id::tfidf_similarity:
    case metric_id::levenshtein_similarity:
    case metric_id::jaccard_similarity:
        return better_direction::higher;
    case metric_id::word_error_rate:
    case metric_id::character_error_rate:
    case metric_id::latency_ms:
    case metric_id::rtf:
        return better_direction::lower;
    }
    throw std::invalid_argument("Unknown metric id");
}
