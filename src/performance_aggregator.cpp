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

#include "performance_aggregator.h"
#include "eval_errors.h"
#include "logger.h"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <utility>

using json = nlohmann::json;

namespace {

double to_non_negative(const json& value, const std::string& field) {
    double number = 0.0;

    if (value.is_number()) {
        number = value.get<double>();
    } else if (value.is_string()) {
        const std::string text = value.get<std::string>();
        const char* begin = text.c_str();
        char* end = nullptr;
        errno = 0;
        number = std::strtod(begin, &end);
        while (end && *end == ' ') ++end;
        if (end == begin || (end && *end != '\0') || errno == ERANGE) {
            throw missing_performance_data("Field '" + field + "' is not a number: \"" + text + "\"");
        }
    } else {
        throw missing_performance_data("Field '" + field + "' has unsupported type " +
                                       std::string(value.type_name()));
    }

    if (!std::isfinite(number) || number < 0.0) {
        throw missing_performance_data("Field '" + field + "' must be a finite non-negative number");
    }
    return number;
}

} // namespace

performance_aggregator::performance_aggregator(std::map<std::string, latency_metadata> entries)
    : m_entries(std::move(entries)) {
}

performance_aggregator performance_aggregator::from_json(const json& root) {
    performance_aggregator aggregator;

    if (root.is_null()) {
        return aggregator;
    }
    if (!root.is_object()) {
        LOG_WARNING("Latency map must be a JSON object keyed by file name, got " +
                    std::string(root.type_name()) + "; ignoring it");
        return aggregator;
    }

    for (auto it = root.begin(); it != root.end(); ++it) {
        try {
            aggregator.m_entries.emplace(it.key(), parse_metadata(it.value()));
        } catch (const missing_performance_data& e) {
            LOG_WARNING("Invalid latency entry for " + it.key() + ": " + e.what());
            aggregator.m_invalid.emplace(it.key(), e.what());
        }
    }

    LOG_DEBUG("Latency map loaded: " + std::to_string(aggregator.m_entries.size()) + " valid, " +
              std::to_string(aggregator.m_invalid.size()) + " invalid entries");
    return aggregator;
}

latency_metadata performance_aggregator::parse_metadata(const json& entry) {
    if (entry.is_number() || entry.is_string()) {
        numeric_latency numeric;
        numeric.latency_ms = to_non_negative(entry, "latency_ms");
        return numeric;
    }

    if (!entry.is_object()) {
        throw missing_performance_data("Latency entry has unsupported type " +
                                       std::string(entry.type_name()));
    }

    if (!entry.contains("latency_ms") || entry["latency_ms"].is_null()) {
        throw missing_performance_data("Latency entry has no 'latency_ms' field (fields: " +
                                       logger::get_json_keys(entry) + ")");
    }

    detailed_latency detailed;
    detailed.latency_ms = to_non_negative(entry["latency_ms"], "latency_ms");

    if (entry.contains("rtf") && !entry["rtf"].is_null()) {
        detailed.rtf = to_non_negative(entry["rtf"], "rtf");
    }

    return detailed;
}

performance_record performance_aggregator::normalize(const latency_metadata& metadata) {
    performance_record record;

    if (const auto* numeric = std::get_if<numeric_latency>(&metadata)) {
        record.latency_ms = numeric->latency_ms;
    } else {
        const auto& detailed = std::get<detailed_latency>(metadata);
        record.latency_ms = detailed.latency_ms;
        record.rtf = detailed.rtf;
    }

    return record;
}

performance_record performance_aggregator::lookup(const std::string& file_name) const {
    auto it = m_entries.find(file_name);
    if (it != m_entries.end()) {
        return normalize(it->second);
    }

    auto invalid = m_invalid.find(file_name);
    if (invalid != m_invalid.end()) {
        throw missing_performance_data("Invalid latency entry for " + file_name + ": " +
                                       invalid->second);
    }

    throw missing_performance_data("No latency entry for " + file_name);
}

bool performance_aggregator::contains(const std::string& file_name) const {
    return m_entries.find(file_name) != m_entries.end();
}
