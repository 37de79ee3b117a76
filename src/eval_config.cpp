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

#include "eval_config.h"
#include "eval_errors.h"
#include "logger.h"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool is_valid_key(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    for (char c : key) {
        const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                        (c >= '0' && c <= '9') || c == '_' || c == '.';
        if (!ok) {
            return false;
        }
    }
    return !(key[0] >= '0' && key[0] <= '9');
}

std::string unquote_double(const std::string& body) {
    std::string out;
    for (size_t i = 0; i < body.size(); ++i) {
        if (body[i] == '\\' && i + 1 < body.size()) {
            const char next = body[++i];
            switch (next) {
            case 'n':  out += '\n'; break;
            case 't':  out += '\t'; break;
            case '"':  out += '"'; break;
            case '\\': out += '\\'; break;
            default:   out += '\\'; out += next; break;
            }
        } else {
            out += body[i];
        }
    }
    return out;
}

std::string format_number(double value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

} // namespace

threshold_set eval_config::make_thresholds() const {
    threshold_set thresholds;
    thresholds.set(metric_id::word_error_rate, wer_threshold);
    thresholds.set(metric_id::character_error_rate, cer_threshold);
    thresholds.set(metric_id::tfidf_similarity, tfidf_threshold);
    thresholds.set(metric_id::latency_ms, latency_threshold_ms);
    thresholds.set(metric_id::rtf, rtf_threshold);
    return thresholds;
}

text_normalizer::config eval_config::make_normalizer_config() const {
    text_normalizer::config cfg;
    cfg.lowercase = true;
    cfg.strip_all_punctuation = strip_punctuation;
    cfg.fold_to_ascii = ascii_fold;
    return cfg;
}

similarity_engine::config eval_config::make_similarity_config() const {
    similarity_engine::config cfg;
    cfg.min_token_length = tfidf_min_token_length;
    return cfg;
}

eval_config config_loader::load(const std::string& env_file) {
    eval_config cfg;
    cfg.env_file = env_file;

    const auto file_values = parse_env_file(env_file);
    apply_settings(cfg, environment_over(file_values));

    return cfg;
}

void config_loader::apply_settings(eval_config& cfg, const lookup_fn& lookup) {
    auto apply_threshold = [&lookup](const std::string& key, double& target, double fallback,
                                     double upper = std::numeric_limits<double>::infinity()) {
        const auto raw = lookup(key);
        if (!raw || trim(*raw).empty()) {
            return;
        }
        try {
            target = parse_threshold(key, *raw, upper);
        } catch (const configuration_error& e) {
            LOG_WARNING(std::string(e.what()) + ", falling back to default " + format_number(fallback));
            target = fallback;
        }
    };

    auto apply_string = [&lookup](const std::string& key, std::string& target) {
        const auto raw = lookup(key);
        if (raw && !trim(*raw).empty()) {
            target = trim(*raw);
        }
    };

    apply_threshold("WER_THRESHOLD", cfg.wer_threshold, default_thresholds::wer);
    apply_threshold("CER_THRESHOLD", cfg.cer_threshold, default_thresholds::cer);
    apply_threshold("TFIDF_THRESHOLD", cfg.tfidf_threshold, default_thresholds::tfidf, 1.0);
    apply_threshold("LATENCY_THRESHOLD_MS", cfg.latency_threshold_ms, default_thresholds::latency_ms);
    apply_threshold("RTF_THRESHOLD", cfg.rtf_threshold, default_thresholds::rtf);

    if (const auto raw = lookup("TFIDF_MIN_TOKEN_LENGTH"); raw && !trim(*raw).empty()) {
        try {
            cfg.tfidf_min_token_length = parse_token_length("TFIDF_MIN_TOKEN_LENGTH", *raw);
        } catch (const configuration_error& e) {
            LOG_WARNING(std::string(e.what()) + ", falling back to default 1");
            cfg.tfidf_min_token_length = 1;
        }
    }

    apply_string("TRANSCRIPTOR_NAME", cfg.transcriptor.name);
    apply_string("TRANSCRIPTOR_VERSION", cfg.transcriptor.version);
    apply_string("TRANSCRIPTOR_ENVIRONMENT", cfg.transcriptor.environment);
    apply_string("TQEVAL_LOG_LEVEL", cfg.log_level);
}

std::map<std::string, std::string> config_loader::parse_env_file(const std::string& path) {
    if (path.empty()) {
        return {};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_DEBUG("No .env file at " + path + ", using environment and defaults");
        return {};
    }

    LOG_INFO("Loading settings from " + path);
    return parse_env_stream(file);
}

std::map<std::string, std::string> config_loader::parse_env_stream(std::istream& input) {
    std::map<std::string, std::string> values;
    std::string line;
    int line_number = 0;

    while (std::getline(input, line)) {
        line_number++;
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line.compare(0, 7, "export ") == 0) {
            line = trim(line.substr(7));
        }

        const auto equals = line.find('=');
        if (equals == std::string::npos) {
            LOG_WARNING(".env line " + std::to_string(line_number) + " has no '=', ignoring it");
            continue;
        }

        const std::string key = trim(line.substr(0, equals));
        if (!is_valid_key(key)) {
            LOG_WARNING(".env line " + std::to_string(line_number) + " has an invalid key '" +
                        key + "', ignoring it");
            continue;
        }

        std::string value = trim(line.substr(equals + 1));
        if (!value.empty() && (value[0] == '"' || value[0] == '\'')) {
            const char quote = value[0];
            size_t closing = value.find(quote, 1);
            while (quote == '"' && closing != std::string::npos && value[closing - 1] == '\\') {
                closing = value.find(quote, closing + 1);
            }
            if (closing == std::string::npos) {
                LOG_WARNING(".env line " + std::to_string(line_number) +
                            " has an unterminated quote, ignoring it");
                continue;
            }
            const std::string body = value.substr(1, closing - 1);
            value = quote == '"' ? unquote_double(body) : body;
        } else {
            const auto comment = value.find(" #");
            if (comment != std::string::npos) {
                value = trim(value.substr(0, comment));
            }
        }

        values[key] = value;
    }

    return values;
}

double config_loader::parse_threshold(const std::string& name, const std::string& raw, double upper) {
    const std::string text = trim(raw);
    if (text.empty()) {
        throw configuration_error("Empty value for " + name);
    }

    const char* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(begin, &end);

    if (end == begin || *end != '\0' || errno == ERANGE) {
        throw configuration_error("Invalid value for " + name + "='" + raw + "'");
    }
    if (!std::isfinite(value) || value < 0.0 || value > upper) {
        throw configuration_error("Out of range value for " + name + "='" + raw + "'");
    }
    return value;
}

size_t config_loader::parse_token_length(const std::string& name, const std::string& raw) {
    const std::string text = trim(raw);
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw configuration_error("Invalid value for " + name + "='" + raw + "'");
    }

    errno = 0;
    const unsigned long value = std::strtoul(text.c_str(), nullptr, 10);
    if (errno == ERANGE || value < 1 || value > 64) {
        throw configuration_error("Out of range value for " + name + "='" + raw + "'");
    }
    return static_cast<size_t>(value);
}

config_loader::lookup_fn config_loader::environment_over(const std::map<std::string, std::string>& env_file_values) {
    return [env_file_values](const std::string& key) -> std::optional<std::string> {
        if (const char* value = std::getenv(key.c_str())) {
            return std::string(value);
        }
        auto it = env_file_values.find(key);
        if (it != env_file_values.end()) {
            return it->second;
        }
        return std::nullopt;
    };
}
