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
#include <map>
#include <string>
#include <vector>

/**
 * @class similarity_engine
 * @brief Vector-space similarity between a reference and a hypothesis
 *
 * TF-IDF weighting:
 * - tf(t, d)  = raw count of t in d
 * - idf(t)    = ln((1 + N) / (1 + df(t))) + 1   (smoothed, never zero)
 * - weight    = tf * idf
 *
 * By default the corpus is exactly the two compared documents (N = 2). A
 * larger corpus may be supplied; terms it has never seen get df = 0.
 *
 * Similarity is the cosine of the two weighted vectors, in [0, 1]. A zero
 * vector on either side (empty text) yields 0 instead of dividing by zero.
 *
 * Vectors are sparse and ordered by term, so every sum is accumulated in the
 * same order and results are bit-identical across runs.
 */
class similarity_engine {
public:
    /// Sparse term -> weight vector
    using term_vector = std::map<std::string, double>;

    /**
     * @struct config
     * @brief Tokenization options for the vectorizer
     */
    struct config {
        size_t min_token_length = 1;    ///< Tokens shorter than this (in code points) are ignored

        config() = default;
    };

    similarity_engine();

    explicit similarity_engine(const config& cfg);

    /**
     * @brief TF-IDF cosine similarity of two normalized texts over their own two-document corpus
     */
    double tfidf_similarity(const std::string& reference, const std::string& hypothesis) const;

    /**
     * @brief TF-IDF cosine similarity of two token sequences over their own two-document corpus
     */
    double tfidf_similarity(const std::vector<std::string>& reference,
                            const std::vector<std::string>& hypothesis) const;

    /**
     * @brief TF-IDF cosine similarity with document frequencies taken from a supplied corpus
     * @param corpus Tokenized documents; usually includes reference and hypothesis
     */
    double tfidf_similarity(const std::vector<std::string>& reference,
                            const std::vector<std::string>& hypothesis,
                            const std::vector<std::vector<std::string>>& corpus) const;

    /**
     * @brief Build the TF-IDF vector of one document against a corpus
     */
    term_vector tfidf_vector(const std::vector<std::string>& document,
                             const std::vector<std::vector<std::string>>& corpus) const;

    /**
     * @brief Cosine of two sparse vectors; 0 if either has zero magnitude
     */
    static double cosine_similarity(const term_vector& a, const term_vector& b);

    /**
     * @brief Smoothed inverse document frequency
     * @param corpus_size N
     * @param document_frequency df(t)
     */
    static double smoothed_idf(size_t corpus_size, size_t document_frequency);

    /**
     * @brief |A ∩ B| / |A ∪ B| over token sets; 1.0 when both are empty, 0.0 when one is
     */
    static double jaccard_similarity(const std::vector<std::string>& reference,
                                     const std::vector<std::string>& hypothesis);

    /**
     * @brief 1 - distance / max(|ref|, |hyp|) over character sequences; 1.0 when both are empty
     */
    static double levenshtein_similarity(const std::vector<std::string>& reference,
                                         const std::vector<std::string>& hypothesis);

private:
    config m_config;

    std::vector<std::string> filter_tokens(const std::vector<std::string>& tokens) const;
};
