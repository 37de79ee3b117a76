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

#include "evaluation_pipeline.h"
#include "error_rate_calculator.h"
#include "eval_errors.h"
#include "logger.h"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <functional>
#include <thread>

namespace {

std::vector<evaluation_record> run_workers(size_t count, int jobs,
                                           const std::function<evaluation_record(size_t)>& task) {
    std::vector<evaluation_record> records(count);
    const size_t workers = std::min(static_cast<size_t>(std::max(jobs, 1)), count);

    if (workers <= 1) {
        for (size_t i = 0; i < count; ++i) {
            records[i] = task(i);
        }
        return records;
    }

    LOG_DEBUG("Evaluating " + std::to_string(count) + " transcripts on " +
              std::to_string(workers) + " workers");

    std::atomic<size_t> next{0};
    std::vector<std::thread> threads;
    threads.reserve(workers);

    for (size_t w = 0; w < workers; ++w) {
        threads.emplace_back([&records, &next, &task, count]() {
            for (size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
                records[i] = task(i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    return records;
}

std::string latency_key(const transcript_input& hypothesis) {
    if (hypothesis.hyp_path.empty()) {
        return hypothesis.name;
    }
    return std::filesystem::path(hypothesis.hyp_path).filename().string();
}

} // namespace

evaluation_pipeline::evaluation_pipeline(const text_normalizer& normalizer,
                                         const threshold_set& thresholds,
                                         const performance_aggregator& performance,
                                         std::optional<transcriptor_info> transcriptor,
                                         const similarity_engine::config& similarity)
    : m_normalizer(normalizer)
    , m_similarity(similarity)
    , m_evaluator(thresholds)
    , m_performance(performance)
    , m_transcriptor(std::move(transcriptor)) {
}

evaluation_record evaluation_pipeline::evaluate(const std::string& reference,
                                                const transcript_input& hypothesis) const {
    return evaluate_prepared(prepare_reference(reference), hypothesis);
}

std::vector<evaluation_record> evaluation_pipeline::evaluate_all(const std::string& reference,
                                                                 const std::vector<transcript_input>& hypotheses,
                                                                 int jobs) const {
    const reference_view prepared = prepare_reference(reference);

    return run_workers(hypotheses.size(), jobs, [this, &prepared, &hypotheses](size_t i) {
        try {
            return evaluate_prepared(prepared, hypotheses[i]);
        } catch (const std::exception& e) {
            LOG_ERROR("Error evaluating " + hypotheses[i].name + ": " + e.what());
            return error_record(hypotheses[i], e.what());
        }
    });
}

std::vector<evaluation_record> evaluation_pipeline::evaluate_files(const std::vector<transcript_pair>& pairs,
                                                                   int jobs) const {
    if (pairs.empty()) {
        return {};
    }

    std::string reference;
    try {
        reference = transcript_source::read_text_file(pairs.front().gt_path);
    } catch (const std::runtime_error& e) {
        throw missing_reference_error(std::string("Cannot read ground truth: ") + e.what());
    }
    const reference_view prepared = prepare_reference(reference);

    return run_workers(pairs.size(), jobs, [this, &prepared, &pairs](size_t i) {
        transcript_input input;
        input.name = pairs[i].name;
        input.gt_path = pairs[i].gt_path;
        input.hyp_path = pairs[i].hyp_path;

        try {
            input.text = transcript_source::read_text_file(pairs[i].hyp_path);
            return evaluate_prepared(prepared, input);
        } catch (const std::exception& e) {
            LOG_ERROR("Error evaluating " + input.name + " (" + input.hyp_path + "): " + e.what());
            return error_record(input, e.what());
        }
    });
}

evaluation_pipeline::reference_view evaluation_pipeline::prepare_reference(const std::string& reference) const {
    const std::string normalized = m_normalizer.normalize(reference);

    reference_view view;
    view.words = text_normalizer::split_words(normalized);
    view.characters = text_normalizer::split_code_points(normalized);

    if (view.words.empty()) {
        LOG_WARNING("Reference text is empty after normalization; WER and CER are undefined");
    }
    return view;
}

evaluation_record evaluation_pipeline::evaluate_prepared(const reference_view& reference,
                                                         const transcript_input& hypothesis) const {
    evaluation_record record;
    record.name = hypothesis.name;
    record.gt_path = hypothesis.gt_path;
    record.hyp_path = hypothesis.hyp_path;
    record.transcriptor = m_transcriptor;
    record.status = evaluation_status::passed;

    attach_text_metrics(reference, hypothesis.text, record);
    attach_performance(hypothesis, record);

    m_evaluator.evaluate(record);

    LOG_INFO("Evaluated " + record.name + ": " + status_name(record.status) + " (" +
             std::to_string(record.passed_metrics) + "/" + std::to_string(record.total_metrics) +
             " metrics passed)");
    return record;
}

void evaluation_pipeline::attach_text_metrics(const reference_view& reference,
                                              const std::string& hypothesis,
                                              evaluation_record& record) const {
    const std::string normalized = m_normalizer.normalize(hypothesis);
    const auto words = text_normalizer::split_words(normalized);
    const auto characters = text_normalizer::split_code_points(normalized);
    LOG_DEBUG(record.name + " normalized: \"" + logger::truncate_text(normalized) + "\"");

    try {
        const auto wer = error_rate_calculator::compute(reference.words, words);
        record.metrics[metric_id::word_error_rate] = wer.rate;
        record.word_alignment = wer.alignment;
    } catch (const undefined_metric_error& e) {
        record.issues.push_back(std::string("word_error_rate not evaluated: ") + e.what());
        LOG_WARNING(record.name + ": word_error_rate not evaluated: " + e.what());
    }

    try {
        const auto cer = error_rate_calculator::compute(reference.characters, characters);
        record.metrics[metric_id::character_error_rate] = cer.rate;
        record.character_alignment = cer.alignment;
    } catch (const undefined_metric_error& e) {
        record.issues.push_back(std::string("character_error_rate not evaluated: ") + e.what());
        LOG_WARNING(record.name + ": character_error_rate not evaluated: " + e.what());
    }

    record.metrics[metric_id::tfidf_similarity] = m_similarity.tfidf_similarity(reference.words, words);
    if (reference.words.empty() || words.empty()) {
        record.issues.push_back("tfidf_similarity is 0 because the " +
                                std::string(reference.words.empty() ? "reference" : "hypothesis") +
                                " is empty");
    }

    record.metrics[metric_id::levenshtein_similarity] =
        similarity_engine::levenshtein_similarity(reference.characters, characters);
    record.metrics[metric_id::jaccard_similarity] =
        similarity_engine::jaccard_similarity(reference.words, words);
}

void evaluation_pipeline::attach_performance(const transcript_input& hypothesis,
                                             evaluation_record& record) const {
    const std::string key = latency_key(hypothesis);

    try {
        const performance_record performance = m_performance.lookup(key);
        record.metrics[metric_id::latency_ms] = performance.latency_ms;
        if (performance.rtf) {
            record.metrics[metric_id::rtf] = *performance.rtf;
        } else {
            LOG_DEBUG(record.name + ": no rtf in latency entry, RTF not evaluated");
        }
    } catch (const missing_performance_data& e) {
        record.performance_missing = true;
        record.issues.push_back(std::string("Missing performance data: ") + e.what());
        LOG_WARNING(record.name + ": " + e.what() + "; latency and RTF not evaluated");
    }
}

evaluation_record evaluation_pipeline::error_record(const transcript_input& hypothesis,
                                                    const std::string& message) const {
    evaluation_record record;
    record.name = hypothesis.name;
    record.gt_path = hypothesis.gt_path;
    record.hyp_path = hypothesis.hyp_path;
    record.transcriptor = m_transcriptor;
    record.status = evaluation_status::error;
    record.issues.push_back(message);
    m_evaluator.evaluate(record);
    return record;
}
