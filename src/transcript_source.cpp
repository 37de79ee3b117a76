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

#include "transcript_source.h"
#include "eval_errors.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::vector<fs::path> list_text_files(const fs::path& directory) {
    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(directory)) {
        if (entry.is_regular_file() && entry.path().extension() == ".txt") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return files;
}

} // namespace

transcript_source::transcript_source(const std::string& texts_dir)
    : m_texts_dir(texts_dir) {
}

std::string transcript_source::find_ground_truth() const {
    const fs::path gt_dir = fs::path(m_texts_dir) / "gt";

    std::error_code ec;
    if (!fs::is_directory(gt_dir, ec)) {
        throw missing_reference_error("Ground-truth directory not found: " + gt_dir.string());
    }

    const auto files = list_text_files(gt_dir);
    if (files.empty()) {
        throw missing_reference_error("No ground-truth .txt file in " + gt_dir.string());
    }
    if (files.size() > 1) {
        std::string names;
        for (const auto& file : files) {
            if (!names.empty()) names += ", ";
            names += file.filename().string();
        }
        throw missing_reference_error("Expected exactly one ground-truth file in " +
                                      gt_dir.string() + ", found " +
                                      std::to_string(files.size()) + " (" + names + ")");
    }

    return files.front().string();
}

std::vector<std::string> transcript_source::find_hypotheses() const {
    std::error_code ec;
    if (!fs::is_directory(m_texts_dir, ec)) {
        throw discovery_error("Texts directory not found: " + m_texts_dir);
    }

    std::vector<std::string> hypotheses;
    for (const auto& file : list_text_files(m_texts_dir)) {
        hypotheses.push_back(file.string());
    }

    if (hypotheses.empty()) {
        throw discovery_error("No transcript .txt files found in " + m_texts_dir);
    }
    return hypotheses;
}

std::vector<transcript_pair> transcript_source::scan() const {
    const auto hypotheses = find_hypotheses();
    const std::string gt_path = find_ground_truth();

    std::vector<transcript_pair> pairs;
    pairs.reserve(hypotheses.size());
    for (const auto& hyp_path : hypotheses) {
        transcript_pair pair;
        pair.name = fs::path(hyp_path).stem().string();
        pair.gt_path = gt_path;
        pair.hyp_path = hyp_path;
        pairs.push_back(pair);
    }

    LOG_INFO("Discovered " + std::to_string(pairs.size()) + " transcript(s) in " + m_texts_dir +
             ", ground truth: " + gt_path);
    return pairs;
}

performance_aggregator transcript_source::load_latency_map(const std::string& path) const {
    const std::string latency_path = path.empty() ? default_latency_path() : path;

    std::ifstream file(latency_path);
    if (!file.is_open()) {
        LOG_WARNING("No latency map at " + latency_path + "; latency and RTF will not be evaluated");
        return performance_aggregator();
    }

    try {
        const json root = json::parse(file);
        LOG_INFO("Latency map loaded from " + latency_path);
        return performance_aggregator::from_json(root);
    } catch (const json::parse_error& e) {
        LOG_WARNING("Could not parse latency map " + latency_path + ": " + e.what());
        return performance_aggregator();
    }
}

std::string transcript_source::default_latency_path() const {
    return (fs::path(m_texts_dir) / "latency.json").string();
}

std::string transcript_source::read_text_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("File not found or unreadable: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string text = buffer.str();

    if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        text.erase(0, 3);
    }

    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}
