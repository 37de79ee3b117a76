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
#include "similarity_engine.h"
#include "text_normalizer.h"
#include "threshold_evaluator.h"
#include <functional>
#include <istream>
#include <limits>
#include <map>
#include <optional>
#include <string>

/**
 * @struct eval_config
 * @brief Every setting of one evaluation run
 *
 * Populated once at start-up (defaults, then .env / environment, then the
 * command line) and read-only afterwards.
 */
struct eval_config {
    // Thresholds
    double wer_threshold = default_thresholds::wer;                ///< WER_THRESHOLD
    double cer_threshold = default_thresholds::cer;                ///< CER_THRESHOLD
    double tfidf_threshold = default_thresholds::tfidf;            ///< TFIDF_THRESHOLD
    double latency_threshold_ms = default_thresholds::latency_ms;  ///< LATENCY_THRESHOLD_MS
    double rtf_threshold = default_thresholds::rtf;                ///< RTF_THRESHOLD

    // Reported as-is
    transcriptor_info transcriptor;                                ///< TRANSCRIPTOR_NAME/VERSION/ENVIRONMENT

    // Normalization
    bool strip_punctuation = true;                                 ///< Drop every non-word character
    bool ascii_fold = true;                                        ///< Strip diacritics, drop non-ASCII
    size_t tfidf_min_token_length = 1;                             ///< TFIDF_MIN_TOKEN_LENGTH

    // Inputs
    std::string texts_dir = "texts";                               ///< Hypotheses here, ground truth in gt/
    std::string latency_file;                                      ///< Empty: <texts_dir>/latency.json
    std::string env_file = ".env";                                 ///< Missing file is not an error

    // Output
    std::string output_file;                                       ///< Empty: console only
    std::string report_format = "json";                            ///< json or txt

    // Execution
    int jobs = 1;                                                  ///< Parallel workers
    std::string log_level = "info";                                ///< TQEVAL_LOG_LEVEL
    bool log_to_file = false;
    std::string log_directory;

    eval_config() = default;

    /**
     * @brief Thresholds in force for this run
     */
    threshold_set make_thresholds() const;

    /**
     * @brief Normalizer switches derived from this configuration
     */
    text_normalizer::config make_normalizer_config() const;

    similarity_engine::config make_similarity_config() const;
};

/**
 * @class config_loader
 * @brief Reads eval_config settings from a .env file and the process environment
 *
 * For each setting the process environment wins over the .env file. An empty
 * value counts as absent. A value that is not a finite non-negative number, or
 * a TF-IDF threshold above 1, is a configuration_error: it is logged and the
 * documented default is kept.
 */
class config_loader {
public:
    /// Looks a setting up by name; empty optional when not set
    using lookup_fn = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Defaults, then the .env file, then the environment
     * @param env_file Path of the .env file; a missing file is skipped
     */
    static eval_config load(const std::string& env_file);

    /**
     * @brief Apply every known setting found through a lookup function
     */
    static void apply_settings(eval_config& cfg, const lookup_fn& lookup);

    /**
     * @brief Parse a .env file into key/value pairs
     * @return Empty map if the file does not exist
     */
    static std::map<std::string, std::string> parse_env_file(const std::string& path);

    /**
     * @brief Parse .env content
     *
     * Accepts "KEY=VALUE", "export KEY=VALUE", "#" comment lines, trailing
     * " #" comments on unquoted values and single or double quoted values.
     * Malformed lines are logged and skipped.
     */
    static std::map<std::string, std::string> parse_env_stream(std::istream& input);

    /**
     * @brief Parse a threshold value
     * @param upper Largest accepted value
     * @throws configuration_error if the text is not a finite number in [0, upper]
     */
    static double parse_threshold(const std::string& name, const std::string& raw,
                                  double upper = std::numeric_limits<double>::infinity());

    /**
     * @brief Parse a minimum token length
     * @throws configuration_error unless the text is a whole number of at least 1
     */
    static size_t parse_token_length(const std::string& name, const std::string& raw);

    /**
     * @brief Lookup chaining the process environment over a .env map
     */
    static lookup_fn environment_over(const std::map<std::string, std::string>& env_file_values);
};
