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

#include "eval_config.h"
#include "evaluation_record.h"
#include <ostream>
#include <string>
#include <vector>

/**
 * @class tqeval_app
 * @brief Command-line front end of the transcript quality evaluator
 *
 * Discovers the transcripts under the texts directory, evaluates each one
 * against the ground truth and the configured thresholds, prints the text
 * report on stdout and optionally writes a report file.
 *
 * Exit status of run():
 * - 0 every transcript passed
 * - 1 at least one transcript failed, was not evaluable or could not be read
 * - 2 the run was aborted (no transcripts, missing ground truth, unwritable report)
 */
class tqeval_app {
public:
    static constexpr int exit_passed = 0;
    static constexpr int exit_failed = 1;
    static constexpr int exit_aborted = 2;

    /**
     * @brief Construct the application with a validated configuration
     * @throws std::invalid_argument if the configuration is invalid
     */
    explicit tqeval_app(const eval_config& cfg, std::ostream& out);

    /**
     * @brief Run one evaluation
     * @return Process exit status
     */
    int run();

    /**
     * @brief Records of the last run, in discovery order
     */
    const std::vector<evaluation_record>& records() const { return m_records; }

    const eval_config& config() const { return m_config; }

    /**
     * @brief Parse command line arguments on top of an already loaded configuration
     * @throws std::invalid_argument for unknown options or malformed values
     */
    static eval_config parse_command_line(int argc, char* argv[], const eval_config& base = eval_config());

    /**
     * @brief Value of --env-file if given, otherwise ".env"
     */
    static std::string find_env_file(int argc, char* argv[]);

    /**
     * @brief Print usage information
     */
    static void print_usage(const char* program_name);

    /**
     * @brief Validate configuration parameters
     */
    static void validate_config(const eval_config& cfg);

private:
    eval_config m_config;
    std::ostream& m_out;
    std::vector<evaluation_record> m_records;

    void initialize_logging();

    void log_settings();
};
