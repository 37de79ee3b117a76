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

#include "tqeval_app.h"
#include "eval_errors.h"
#include "evaluation_pipeline.h"
#include "logger.h"
#include "report_writer.h"
#include "transcript_source.h"
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

int parse_int(const std::string& option, const std::string& raw) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(raw, &consumed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid value for " + option + ": '" + raw + "'");
    }
    if (consumed != raw.size()) {
        throw std::invalid_argument("Invalid value for " + option + ": '" + raw + "'");
    }
    return value;
}

std::string format_limit(const threshold& limit) {
    std::ostringstream ss;
    ss << (limit.direction == better_direction::lower ? "<= " : ">= ") << limit.limit;
    return ss.str();
}

} // namespace

tqeval_app::tqeval_app(const eval_config& cfg, std::ostream& out)
    : m_config(cfg)
    , m_out(out) {
    validate_config(m_config);
}

int tqeval_app::run() {
    initialize_logging();
    LOG_INFO("tqeval starting...");
    log_settings();

    const threshold_set thresholds = m_config.make_thresholds();

    try {
        transcript_source source(m_config.texts_dir);
        const auto pairs = source.scan();
        const performance_aggregator performance = source.load_latency_map(m_config.latency_file);

        if (performance.invalid_count() > 0) {
            LOG_WARNING(std::to_string(performance.invalid_count()) +
                        " latency entries were rejected and will count as missing");
        }

        const text_normalizer normalizer(m_config.make_normalizer_config());
        const evaluation_pipeline pipeline(normalizer, thresholds, performance, m_config.transcriptor,
                                           m_config.make_similarity_config());

        m_records = pipeline.evaluate_files(pairs, m_config.jobs);
    } catch (const missing_reference_error& e) {
        LOG_ERROR(std::string("Run aborted: ") + e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return exit_aborted;
    } catch (const discovery_error& e) {
        LOG_ERROR(std::string("Run aborted: ") + e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return exit_aborted;
    }

    const report_writer writer(thresholds, m_config.transcriptor);
    m_out << writer.to_text(m_records);
    m_out.flush();

    if (!m_config.output_file.empty()) {
        try {
            writer.export_results(m_records, m_config.output_file, m_config.report_format);
        } catch (const std::runtime_error& e) {
            LOG_ERROR(e.what());
            std::cerr << "Error: " << e.what() << std::endl;
            return exit_aborted;
        }
    }

    const bool passed = threshold_evaluator::all_passed(m_records);
    LOG_INFO(std::string("tqeval finished: ") + (passed ? "all transcripts passed" : "some transcripts did not pass"));
    logger::instance().flush();

    return passed ? exit_passed : exit_failed;
}

void tqeval_app::initialize_logging() {
    logger::instance().init(m_config.log_to_file, true, m_config.log_directory);

    const auto level = logger::parse_level(m_config.log_level, logger::Level::INFO);
    logger::instance().set_min_level(level);

    if (logger::parse_level(m_config.log_level, logger::Level::ERROR) != level) {
        LOG_WARNING("Unknown log level '" + m_config.log_level + "', using info");
    }

    if (m_config.log_to_file) {
        const std::string log_file = logger::instance().get_log_file_name();
        if (log_file.empty()) {
            LOG_WARNING("File logging requested but the log file could not be opened");
        } else {
            LOG_INFO("Logging to " + log_file);
        }
    }
}

void tqeval_app::log_settings() {
    std::vector<std::string> lines;
    lines.push_back("Texts directory: " + m_config.texts_dir);
    lines.push_back("Latency map: " + (m_config.latency_file.empty() ? std::string("<texts>/latency.json")
                                                                     : m_config.latency_file));
    lines.push_back("Transcriptor: " + m_config.transcriptor.name + " " + m_config.transcriptor.version +
                    " (" + m_config.transcriptor.environment + ")");
    for (const auto& [id, limit] : m_config.make_thresholds().entries()) {
        lines.push_back(metric_label(id) + " " + format_limit(limit));
    }
    lines.push_back("Punctuation: " + std::string(m_config.strip_punctuation ? "stripped" : "kept"));
    lines.push_back("ASCII folding: " + std::string(m_config.ascii_fold ? "on" : "off"));
    lines.push_back("TF-IDF minimum token length: " + std::to_string(m_config.tfidf_min_token_length));
    lines.push_back("Workers: " + std::to_string(m_config.jobs));

    logger::instance().log_section("Evaluation settings", lines);
}

eval_config tqeval_app::parse_command_line(int argc, char* argv[], const eval_config& base) {
    eval_config cfg = base;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "--texts" && has_value) {
            cfg.texts_dir = argv[++i];
        } else if (arg == "--latency" && has_value) {
            cfg.latency_file = argv[++i];
        } else if (arg == "--env-file" && has_value) {
            cfg.env_file = argv[++i];
        } else if (arg == "--output" && has_value) {
            cfg.output_file = argv[++i];
        } else if (arg == "--format" && has_value) {
            cfg.report_format = argv[++i];
        } else if (arg == "--jobs" && has_value) {
            cfg.jobs = parse_int(arg, argv[++i]);
        } else if (arg == "--log-level" && has_value) {
            cfg.log_level = argv[++i];
        } else if (arg == "--log-file") {
            cfg.log_to_file = true;
        } else if (arg == "--log-dir" && has_value) {
            cfg.log_to_file = true;
            cfg.log_directory = argv[++i];
        } else if (arg == "--wer" && has_value) {
            cfg.wer_threshold = config_loader::parse_threshold(arg, argv[++i]);
        } else if (arg == "--cer" && has_value) {
            cfg.cer_threshold = config_loader::parse_threshold(arg, argv[++i]);
        } else if (arg == "--tfidf" && has_value) {
            cfg.tfidf_threshold = config_loader::parse_threshold(arg, argv[++i]);
        } else if (arg == "--latency-ms" && has_value) {
            cfg.latency_threshold_ms = config_loader::parse_threshold(arg, argv[++i]);
        } else if (arg == "--rtf" && has_value) {
            cfg.rtf_threshold = config_loader::parse_threshold(arg, argv[++i]);
        } else if (arg == "--tfidf-min-token-length" && has_value) {
            const int length = parse_int(arg, argv[++i]);
            if (length < 1) {
                throw std::invalid_argument("Invalid value for " + arg + ": must be at least 1");
            }
            cfg.tfidf_min_token_length = static_cast<size_t>(length);
        } else if (arg == "--keep-punctuation") {
            cfg.strip_punctuation = false;
        } else if (arg == "--no-ascii-fold") {
            cfg.ascii_fold = false;
        } else if (arg == "--help" || arg == "-h") {
            // Help is handled by caller
            continue;
        } else {
            throw std::invalid_argument("Unknown or incomplete argument: " + arg);
        }
    }

    return cfg;
}

std::string tqeval_app::find_env_file(int argc, char* argv[]) {
    std::string env_file = ".env";
    for (int i = 1; i + 1 < argc; i++) {
        if (std::string(argv[i]) == "--env-file") {
            env_file = argv[i + 1];
        }
    }
    return env_file;
}

void tqeval_app::print_usage(const char* program_name) {
    std::cout << "tqeval - Transcript quality evaluator\n"
              << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  --texts DIR        Transcripts directory, ground truth in DIR/gt (default: texts)\n"
              << "  --latency FILE     Latency map JSON (default: DIR/latency.json)\n"
              << "  --env-file FILE    Settings file (default: .env, optional)\n"
              << "  --output FILE      Also write the report to FILE\n"
              << "  --format FMT       Report file format: json, txt (default: json)\n"
              << "  --jobs N           Evaluate N transcripts in parallel (default: 1)\n"
              << "\n"
              << "Thresholds (override WER_THRESHOLD, CER_THRESHOLD, ...):\n"
              << "  --wer X            Maximum word error rate (default: 0.15)\n"
              << "  --cer X            Maximum character error rate (default: 0.10)\n"
              << "  --tfidf X          Minimum TF-IDF cosine similarity (default: 0.75)\n"
              << "  --latency-ms X     Maximum latency in milliseconds (default: 800)\n"
              << "  --rtf X            Maximum real-time factor (default: 0.8)\n"
              << "\n"
              << "Normalization:\n"
              << "  --keep-punctuation Do not strip punctuation before scoring\n"
              << "  --no-ascii-fold    Keep accented and non-Latin characters\n"
              << "  --tfidf-min-token-length N\n"
              << "                     Ignore shorter tokens in TF-IDF (default: 1)\n"
              << "\n"
              << "Logging:\n"
              << "  --log-level LEVEL  debug, info, warning, error (default: info)\n"
              << "  --log-file         Also log to tqeval_log_YYYYMMDD_HHMMSS.log\n"
              << "  --log-dir DIR      Directory for the log file (implies --log-file)\n"
              << "\n"
              << "  --help             Show this help message\n"
              << "\n"
              << "Exit status: 0 all passed, 1 some transcript did not pass, 2 run aborted\n"
              << "\n"
              << "Examples:\n"
              << "  Default layout:    " << program_name << "\n"
              << "  Strict WER:        " << program_name << " --texts data --wer 0.05\n"
              << "  JSON report:       " << program_name << " --output report.json --format json\n";
}

void tqeval_app::validate_config(const eval_config& cfg) {
    if (cfg.texts_dir.empty()) {
        throw std::invalid_argument("Texts directory is required");
    }

    const double limits[] = {cfg.wer_threshold, cfg.cer_threshold, cfg.tfidf_threshold,
                             cfg.latency_threshold_ms, cfg.rtf_threshold};
    for (double limit : limits) {
        if (!std::isfinite(limit) || limit < 0.0) {
            throw std::invalid_argument("Thresholds must be finite and non-negative");
        }
    }

    if (cfg.tfidf_threshold > 1.0) {
        throw std::invalid_argument("TF-IDF threshold must be between 0 and 1");
    }

    if (cfg.tfidf_min_token_length < 1 || cfg.tfidf_min_token_length > 64) {
        throw std::invalid_argument("TF-IDF minimum token length must be between 1 and 64");
    }

    if (cfg.jobs < 1 || cfg.jobs > 64) {
        throw std::invalid_argument("Jobs must be between 1 and 64");
    }

    if (cfg.report_format != "json" && cfg.report_format != "txt") {
        throw std::invalid_argument("Invalid report format. Must be: json or txt");
    }
}
