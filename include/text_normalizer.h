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

#include <string>
#include <vector>

/**
 * @class text_normalizer
 * @brief Canonicalizes raw transcript text before any comparison
 *
 * The same normalizer instance feeds the error-rate calculator and the
 * similarity engine so every metric sees one canonical form.
 *
 * @par Pipeline (in order):
 * 1. Decode UTF-8 into code points (invalid bytes are kept as single units)
 * 2. Optional ASCII folding: accented Latin letters lose their diacritics,
 *    Unicode spaces become ' ', every other non-ASCII code point is dropped
 * 3. Lower-casing (ASCII, Latin-1, Latin Extended-A, basic Greek and Cyrillic),
 *    independent of the process locale
 * 4. Punctuation stripping: the configured character set, plus every
 *    non-word character when strip_all_punctuation is set
 * 5. Whitespace runs collapse to one ' ', both ends trimmed
 *
 * @par Views:
 * - words(): tokens split on ' ', empty tokens discarded (WER input)
 * - characters(): code points of the normalized text, spaces included (CER input)
 *
 * All methods are const and pure, so one instance may be shared across threads.
 */
class text_normalizer {
public:
    /**
     * @struct config
     * @brief Normalization switches
     */
    struct config {
        bool lowercase = true;                 ///< Fold letter case
        std::string strip_characters;          ///< Extra characters to remove (UTF-8, default none)
        bool strip_all_punctuation = false;    ///< Remove every non-word, non-space character
        bool fold_to_ascii = false;            ///< Strip diacritics and drop other non-ASCII

        config() = default;
    };

    text_normalizer();

    explicit text_normalizer(const config& cfg);

    /**
     * @brief Produce the canonical form of a text
     * @param text Raw UTF-8 text
     * @return Normalized text, single-spaced, no leading/trailing whitespace
     */
    std::string normalize(const std::string& text) const;

    /**
     * @brief Normalize and split into word tokens
     */
    std::vector<std::string> words(const std::string& text) const;

    /**
     * @brief Normalize and split into code points (spaces kept)
     */
    std::vector<std::string> characters(const std::string& text) const;

    const config& get_config() const { return m_config; }

    /**
     * @brief Split already-normalized text on whitespace, dropping empty tokens
     */
    static std::vector<std::string> split_words(const std::string& normalized);

    /**
     * @brief Split UTF-8 text into one string per code point
     */
    static std::vector<std::string> split_code_points(const std::string& utf8);

private:
    config m_config;
    std::vector<char32_t> m_strip_set;         ///< Decoded strip_characters, sorted
};
