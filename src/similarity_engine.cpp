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

#include "similarity_engine.h"
#include "edit_distance.h"
#include "text_normalizer.h"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <set>

similarity_engine::similarity_engine()
    : similarity_engine(config{}) {
}

similarity_engine::similarity_engine(const config& cfg)
    : m_config(cfg) {
}

double similarity_engine::tfidf_similarity(const std::string& reference,
                                           const std::string& hypothesis) const {
    return tfidf_similarity(text_normalizer::split_words(reference),
                            text_normalizer::split_words(hypothesis));
}

double similarity_engine::tfidf_similarity(const std::vector<std::string>& reference,
                                           const std::vector<std::string>& hypothesis) const {
    const std::vector<std::vector<std::string>> corpus = {reference, hypothesis};
    return tfidf_similarity(reference, hypothesis, corpus);
}

double similarity_engine::tfidf_similarity(const std::vector<std::string>& reference,
                                           const std::vector<std::string>& hypothesis,
                                           const std::vector<std::vector<std::string>>& corpus) const {
    return cosine_similarity(tfidf_vector(reference, corpus), tfidf_vector(hypothesis, corpus));
}

similarity_engine::term_vector
similarity_engine::tfidf_vector(const std::vector<std::string>& document,
                                const std::vector<std::vector<std::string>>& corpus) const {
    term_vector counts;
    for (const auto& token : filter_tokens(document)) {
        counts[token] += 1.0;
    }

    // Document frequency of the terms this document actually uses
    std::map<std::string, size_t> document_frequency;
    for (const auto& entry : counts) {
        document_frequency[entry.first] = 0;
    }
    for (const auto& other : corpus) {
        const auto filtered = filter_tokens(other);
        const std::set<std::string> unique_terms(filtered.begin(), filtered.end());
        for (const auto& term : unique_terms) {
            auto it = document_frequency.find(term);
            if (it != document_frequency.end()) {
                it->second++;
            }
        }
    }

    term_vector weights;
    for (const auto& entry : counts) {
        weights[entry.first] = entry.second * smoothed_idf(corpus.size(),
                                                           document_frequency[entry.first]);
    }
    return weights;
}

double similarity_engine::cosine_similarity(const term_vector& a, const term_vector& b) {
    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (const auto& entry : a) {
        norm_a += entry.second * entry.second;
    }
    for (const auto& entry : b) {
        norm_b += entry.second * entry.second;
    }

    // Both maps are ordered by term, walk them together
    auto it_a = a.begin();
    auto it_b = b.begin();
    while (it_a != a.end() && it_b != b.end()) {
        if (it_a->first < it_b->first) {
            ++it_a;
        } else if (it_b->first < it_a->first) {
            ++it_b;
        } else {
            dot += it_a->second * it_b->second;
            ++it_a;
            ++it_b;
        }
    }

    if (norm_a <= 0.0 || norm_b <= 0.0) {
        return 0.0;
    }

    // One square root, so a vector compared with itself gives exactly 1
    const double similarity = dot / std::sqrt(norm_a * norm_b);
    return std::min(1.0, std::max(0.0, similarity));
}

double similarity_engine::smoothed_idf(size_t corpus_size, size_t document_frequency) {
    return std::log((1.0 + static_cast<double>(corpus_size)) /
                    (1.0 + static_cast<double>(document_frequency))) + 1.0;
}

double similarity_engine::jaccard_similarity(const std::vector<std::string>& reference,
                                             const std::vector<std::string>& hypothesis) {
    const std::set<std::string> ref_set(reference.begin(), reference.end());
    const std::set<std::string> hyp_set(hypothesis.begin(), hypothesis.end());

    if (ref_set.empty() && hyp_set.empty()) {
        return 1.0;
    }
    if (ref_set.empty() || hyp_set.empty()) {
        return 0.0;
    }

    std::vector<std::string> shared;
    std::set_intersection(ref_set.begin(), ref_set.end(), hyp_set.begin(), hyp_set.end(),
                          std::back_inserter(shared));

    const size_t union_size = ref_set.size() + hyp_set.size() - shared.size();
    return static_cast<double>(shared.size()) / static_cast<double>(union_size);
}

double similarity_engine::levenshtein_similarity(const std::vector<std::string>& reference,
                                                 const std::vector<std::string>& hypothesis) {
    const size_t longest = std::max(reference.size(), hypothesis.size());
    if (longest == 0) {
        return 1.0;
    }

    const size_t distance = edit_distance::distance(reference, hypothesis);
    return 1.0 - static_cast<double>(distance) / static_cast<double>(longest);
}

std::vector<std::string> similarity_engine::filter_tokens(const std::vector<std::string>& tokens) const {
    std::vector<std::string> kept;
    kept.reserve(tokens.size());

    for (const auto& token : tokens) {
        if (token.empty()) {
            continue;
        }
        if (m_config.min_token_length > 1 &&
            text_normalizer::split_code_points(token).size() < m_config.min_token_length) {
            continue;
        }
        kept.push_back(token);
    }
    return kept;
}
