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

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "report_writer.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using ::testing::HasSubstr;
using ::testing::Not;

class ReportWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        transcriptor.name = "vosk";
        transcriptor.version = "0.3.45";
        transcriptor.environment = "ci";

        passing = evaluator.evaluate(metric_map{{metric_id::word_error_rate, 0.05},
                                                {metric_id::character_error_rate, 0.02},
                                                {metric_id::tfidf_similarity, 0.9},
                                                {metric_id::latency_ms, 650.0},
                                                {metric_id::jaccard_similarity, 0.8}});
        passing.name = "transcript1";
        passing.hyp_path = "texts/transcript1.txt";
        passing.gt_path = "texts/gt/reference.txt";
        passing.transcriptor = transcriptor;
        alignment_result words;
        words.substitutions = 1;
        words.reference_length = 20;
        words.hypothesis_length = 20;
        passing.word_alignment = words;

        failing = evaluator.evaluate(metric_map{{metric_id::word_error_rate, 0.4},
                                                {metric_id::character_error_rate, 0.2},
                                                {metric_id::tfidf_similarity, 0.5}});
        failing.name = "transcript2";
        failing.performance_missing = true;
        failing.issues.push_back("Missing performance data: No latency entry for transcript2.txt");
    }

    threshold_evaluator evaluator{threshold_set::defaults()};
    transcriptor_info transcriptor;
    evaluation_record passing;
    evaluation_record failing;
};

TEST_F(ReportWriterTest, RecordJsonShape) {
    auto output = report_writer::record_to_json(passing);

    EXPECT_EQ(output["name"], "transcript1");
    EXPECT_EQ(output["hyp_path"], "texts/transcript1.txt");
    EXPECT_DOUBLE_EQ(output["metrics"]["word_error_rate"].get<double>(), 0.05);
    EXPECT_DOUBLE_EQ(output["metrics"]["jaccard_similarity"].get<double>(), 0.8);
    EXPECT_FALSE(output["metrics"].contains("rtf"));
    EXPECT_TRUE(output["evaluations"]["wer_passed"].get<bool>());
    EXPECT_TRUE(output["evaluations"]["latency_passed"].get<bool>());
    EXPECT_FALSE(output["evaluations"].contains("rtf_passed"));
    EXPECT_FALSE(output["evaluations"].contains("jaccard_passed"));
    EXPECT_DOUBLE_EQ(output["thresholds"]["wer_threshold"].get<double>(), 0.15);
    EXPECT_DOUBLE_EQ(output["thresholds"]["latency_threshold_ms"].get<double>(), 800.0);
    EXPECT_EQ(output["passed_metrics"], 4);
    EXPECT_EQ(output["total_metrics"], 4);
    EXPECT_TRUE(output["overall_passed"].get<bool>());
    EXPECT_EQ(output["status"], "passed");
    EXPECT_EQ(output["transcriptor"]["name"], "vosk");
    EXPECT_EQ(output["word_alignment"]["substitutions"], 1);
    EXPECT_FALSE(output.contains("character_alignment"));
}

TEST_F(ReportWriterTest, RecordJsonWithoutTranscriptor) {
    auto output = report_writer::record_to_json(failing);

    EXPECT_FALSE(output.contains("transcriptor"));
    EXPECT_TRUE(output["performance_missing"].get<bool>());
    EXPECT_EQ(output["issues"].size(), 1u);
    EXPECT_EQ(output["status"], "failed");
}

TEST_F(ReportWriterTest, ReportSummary) {
    report_writer writer(threshold_set::defaults(), transcriptor);
    auto report = writer.to_json({passing, failing});

    EXPECT_EQ(report["generated_by"], "tqeval");
    EXPECT_EQ(report["transcriptor"]["version"], "0.3.45");
    EXPECT_EQ(report["records"].size(), 2u);
    EXPECT_EQ(report["summary"]["total"], 2);
    EXPECT_EQ(report["summary"]["passed"], 1);
    EXPECT_EQ(report["summary"]["failed"], 1);
    EXPECT_FALSE(report["summary"]["all_passed"].get<bool>());
    EXPECT_DOUBLE_EQ(report["thresholds"]["rtf_threshold"].get<double>(), 0.8);
}

TEST_F(ReportWriterTest, SummaryCountsEveryStatus) {
    evaluation_record broken;
    broken.status = evaluation_status::error;
    auto empty = evaluator.evaluate(metric_map{});

    auto counts = report_writer::summarize({passing, failing, broken, empty});
    EXPECT_EQ(counts.total, 4u);
    EXPECT_EQ(counts.passed, 1u);
    EXPECT_EQ(counts.failed, 1u);
    EXPECT_EQ(counts.errors, 1u);
    EXPECT_EQ(counts.not_evaluable, 1u);
    EXPECT_FALSE(counts.all_passed);

    EXPECT_TRUE(report_writer::summarize({passing}).all_passed);
}

TEST_F(ReportWriterTest, TextReport) {
    report_writer writer(threshold_set::defaults(), transcriptor);
    const std::string text = writer.to_text({passing, failing});

    EXPECT_THAT(text, HasSubstr("[transcript1] PASSED (4/4 metrics passed)"));
    EXPECT_THAT(text, HasSubstr("[transcript2] FAILED (0/3 metrics passed)"));
    EXPECT_THAT(text, HasSubstr("0.050"));
    EXPECT_THAT(text, HasSubstr("N/A"));
    EXPECT_THAT(text, HasSubstr("not evaluated"));
    EXPECT_THAT(text, HasSubstr("Missing performance data"));
    EXPECT_THAT(text, HasSubstr("Overall: FAILED"));
    EXPECT_THAT(text, HasSubstr("Name: vosk"));
}

TEST_F(ReportWriterTest, FormatValue) {
    EXPECT_EQ(report_writer::format_value(passing, metric_id::latency_ms), "650.000");
    EXPECT_EQ(report_writer::format_value(passing, metric_id::rtf), "N/A");
}

TEST_F(ReportWriterTest, OutputIsDeterministic) {
    report_writer writer(threshold_set::defaults());
    std::ostringstream first;
    std::ostringstream second;

    writer.write({passing, failing}, first, "json");
    writer.write({passing, failing}, second, "json");

    EXPECT_EQ(first.str(), second.str());
    EXPECT_TRUE(nlohmann::json::parse(first.str())["transcriptor"].is_null());
}

TEST_F(ReportWriterTest, UnknownFormatIsRejected) {
    report_writer writer(threshold_set::defaults());
    std::ostringstream out;

    EXPECT_THROW(writer.write({passing}, out, "csv"), std::invalid_argument);
}

TEST_F(ReportWriterTest, InvalidUtf8PathIsReplacedInJson) {
    report_writer writer(threshold_set::defaults());
    passing.name = "take\xff";
    passing.hyp_path = "texts/take\xff.txt";
    std::ostringstream out;

    ASSERT_NO_THROW(writer.write({passing}, out, "json"));

    auto report = nlohmann::json::parse(out.str());
    EXPECT_EQ(report["records"][0]["name"], "take\xef\xbf\xbd");
    EXPECT_EQ(report["records"][0]["hyp_path"], "texts/take\xef\xbf\xbd.txt");
}

TEST_F(ReportWriterTest, ExportToFile) {
    const auto path = std::filesystem::temp_directory_path() /
                      ("tqeval_report_" + std::to_string(getpid()) + ".json");
    report_writer writer(threshold_set::defaults(), transcriptor);

    writer.export_results({passing}, path.string(), "json");

    std::ifstream file(path);
    auto report = nlohmann::json::parse(file);
    EXPECT_TRUE(report["summary"]["all_passed"].get<bool>());
    std::filesystem::remove(path);

    EXPECT_THROW(writer.export_results({passing}, "/nonexistent-dir/report.json", "json"), std::runtime_error);
}
