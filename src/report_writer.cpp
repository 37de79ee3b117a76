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

#include "report_writer.h"
#include "logger.h"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {

json alignment_to_json(const alignment_result& alignment) {
    return {
        {"substitutions", alignment.substitutions},
        {"insertions", alignment.insertions},
        {"deletions", alignment.deletions},
        {"errors", alignment.errors()},
        {"reference_length", alignment.reference_length},
        {"hypothesis_length", alignment.hypothesis_length}
    };
}

std::string format_number(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(3) << value;
    return ss.str();
}

} // namespace

report_writer::report_writer(const threshold_set& thresholds,
                             std::optional<transcriptor_info> transcriptor)
    : m_thresholds(thresholds)
    , m_transcriptor(std::move(transcriptor)) {
}

json report_writer::transcriptor_to_json(const transcriptor_info& transcriptor) {
    return {
        {"name", transcriptor.name},
        {"version", transcriptor.version},
        {"environment", transcriptor.environment}
    };
}

json report_writer::thresholds_to_json(const std::map<metric_id, threshold>& thresholds) {
    json output = json::object();
    for (const auto& [id, limit] : thresholds) {
        output[threshold_key(id)] = limit.limit;
    }
    return output;
}

json report_writer::record_to_json(const evaluation_record& record) {
    json output;
    output["name"] = record.name;
    output["gt_path"] = record.gt_path;
    output["hyp_path"] = record.hyp_path;

    json metrics = json::object();
    for (const auto& [id, value] : record.metrics) {
        metrics[metric_name(id)] = value;
    }
    output["metrics"] = metrics;

    json evaluations = json::object();
    for (const auto& [id, passed] : record.evaluations) {
        evaluations[evaluation_key(id)] = passed;
    }
    output["evaluations"] = evaluations;

    output["thresholds"] = thresholds_to_json(record.thresholds);
    output["passed_metrics"] = record.passed_metrics;
    output["total_metrics"] = record.total_metrics;
    output["overall_passed"] = record.overall_passed;
    output["status"] = status_name(record.status);
    output["performance_missing"] = record.performance_missing;
    output["issues"] = record.issues;

    if (record.word_alignment) {
        output["word_alignment"] = alignment_to_json(*record.word_alignment);
    }
    if (record.character_alignment) {
        output["character_alignment"] = alignment_to_json(*record.character_alignment);
    }
    if (record.transcriptor) {
        output["transcriptor"] = transcriptor_to_json(*record.transcriptor);
    }

    return output;
}

report_writer::summary report_writer::summarize(const std::vector<evaluation_record>& records) {
    summary result;
    result.total = records.size();

    for (const auto& record : records) {
        switch (record.status) {
        case evaluation_status::passed:        result.passed++; break;
        case evaluation_status::failed:        result.failed++; break;
        case evaluation_status::not_evaluable: result.not_evaluable++; break;
        case evaluation_status::error:         result.errors++; break;
        }
    }

    result.all_passed = threshold_evaluator::all_passed(records);
    return result;
}

json report_writer::to_json(const std::vector<evaluation_record>& records) const {
    json output;

    output["generated_by"] = "tqeval";
    output["transcriptor"] = m_transcriptor ? transcriptor_to_json(*m_transcriptor) : json(nullptr);
    output["thresholds"] = thresholds_to_json(m_thresholds.entries());

    json entries = json::array();
    for (const auto& record : records) {
        entries.push_back(record_to_json(record));
    }
    output["records"] = entries;

    const summary counts = summarize(records);
    output["summary"] = {
        {"total", counts.total},
        {"passed", counts.passed},
        {"failed", counts.failed},
        {"not_evaluable", counts.not_evaluable},
        {"errors", counts.errors},
        {"all_passed", counts.all_passed}
    };

    return output;
}

std::string report_writer::format_value(const evaluation_record& record, metric_id id) {
    auto it = record.metrics.find(id);
    if (it == record.metrics.end()) {
        return "N/A";
    }
    return format_number(it->second);
}

void report_writer::format_record(const evaluation_record& record, std::ostream& out) const {
    std::string verdict;
    switch (record.status) {
    case evaluation_status::passed:        verdict = "PASSED"; break;
    case evaluation_status::failed:        verdict = "FAILED"; break;
    case evaluation_status::not_evaluable: verdict = "NOT EVALUABLE"; break;
    case evaluation_status::error:         verdict = "ERROR"; break;
    }

    out << "[" << record.name << "] " << verdict << " ("
        << record.passed_metrics << "/" << record.total_metrics << " metrics passed)\n";
    out << "  Hypothesis: " << record.hyp_path << "\n";

    for (metric_id id : all_metrics()) {
        out << "  " << std::left << std::setw(26) << metric_label(id)
            << std::setw(10) << format_value(record, id);

        auto limit = record.thresholds.find(id);
        auto evaluation = record.evaluations.find(id);
        if (evaluation != record.evaluations.end()) {
            out << (limit->second.direction == better_direction::lower ? "<= " : ">= ")
                << std::setw(10) << format_number(limit->second.limit)
                << (evaluation->second ? "PASS" : "FAIL");
        } else if (limit != record.thresholds.end()) {
            out << "not evaluated";
        }
        out << "\n";
    }

    if (record.word_alignment) {
        const auto& words = *record.word_alignment;
        out << "  Word errors: " << words.errors() << " of " << words.reference_length
            << " (S=" << words.substitutions << ", D=" << words.deletions
            << ", I=" << words.insertions << ")\n";
    }

    if (!record.issues.empty()) {
        out << "  Issues:\n";
        for (const auto& issue : record.issues) {
            out << "    - " << issue << "\n";
        }
    }
    out << "\n";
}

std::string report_writer::to_text(const std::vector<evaluation_record>& records) const {
    std::ostringstream out;

    out << "=== TRANSCRIPT EVALUATION REPORT ===\n\n";

    if (m_transcriptor) {
        out << "TRANSCRIPTOR:\n"
            << "  Name: " << m_transcriptor->name << "\n"
            << "  Version: " << m_transcriptor->version << "\n"
            << "  Environment: " << m_transcriptor->environment << "\n\n";
    }

    out << "THRESHOLDS:\n";
    for (const auto& [id, limit] : m_thresholds.entries()) {
        out << "  " << std::left << std::setw(26) << metric_label(id)
            << (limit.direction == better_direction::lower ? "<= " : ">= ")
            << format_number(limit.limit) << "\n";
    }
    out << "\n";

    out << "RESULTS:\n";
    for (const auto& record : records) {
        format_record(record, out);
    }

    const summary counts = summarize(records);
    out << "SUMMARY:\n"
        << "  Transcripts: " << counts.total << "\n"
        << "  Passed: " << counts.passed << "\n"
        << "  Failed: " << counts.failed << "\n";
    if (counts.not_evaluable > 0) {
        out << "  Not evaluable: " << counts.not_evaluable << "\n";
    }
    if (counts.errors > 0) {
        out << "  Errors: " << counts.errors << "\n";
    }
    out << "  Overall: " << (counts.all_passed ? "PASSED" : "FAILED") << "\n";

    return out.str();
}

void report_writer::write(const std::vector<evaluation_record>& records,
                          std::ostream& out,
                          const std::string& format) const {
    if (format == "json") {
        // File names are not guaranteed to be UTF-8
        out << to_json(records).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    } else if (format == "txt") {
        out << to_text(records);
    } else {
        throw std::invalid_argument("Invalid report format '" + format + "'. Must be: json or txt");
    }
}

void report_writer::export_results(const std::vector<evaluation_record>& records,
                                   const std::string& output_path,
                                   const std::string& format) const {
    std::ofstream file(output_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open report output file: " + output_path);
    }

    write(records, file, format);
    file.close();

    LOG_INFO("Evaluation report exported to: " + output_path);
}
