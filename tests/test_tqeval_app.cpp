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
#include "tqeval_app.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using ::testing::HasSubstr;
using json = nlohmann::json;

namespace fs = std::filesystem;

class TqevalAppTest : public ::testing::Test {
protected:
    void SetUp() override {
        texts_dir = fs::temp_directory_path() / ("tqeval_app_" + std::to_string(getpid()));
        fs::create_directories(texts_dir / "gt");
        write_file(texts_dir / "gt" / "reference.txt", "The weather is nice today.");
        write_file(texts_dir / "transcript1.txt", "the weather is nice, today!");
        write_file(texts_dir / "latency.json", R"({"transcript1.txt": 650})");
    }

    void TearDown() override {
        fs::remove_all(texts_dir);
    }

    void write_file(const fs::path& path, const std::string& content) {
        std::ofstream(path) << content;
    }

    eval_config create_valid_config() {
        eval_config cfg;
        cfg.texts_dir = texts_dir.string();
        cfg.log_level = "error";
        return cfg;
    }

    fs::path texts_dir;
    std::ostringstream out;
};

TEST_F(TqevalAppTest, ConfigValidation) {
    auto cfg = create_valid_config();
    EXPECT_NO_THROW(tqeval_app::validate_config(cfg));

    cfg.texts_dir = "";
    EXPECT_THROW(tqeval_app::validate_config(cfg), std::invalid_argument);

    cfg = create_valid_config();
    cfg.tfidf_threshold = 1.5;
    EXPECT_THROW(tqeval_app::validate_config(cfg), std::invalid_argument);

    cfg = create_valid_config();
    cfg.wer_threshold = -0.1;
    EXPECT_THROW(tqeval_app::validate_config(cfg), std::invalid_argument);

    cfg = create_valid_config();
    cfg.jobs = 0;
    EXPECT_THROW(tqeval_app::validate_config(cfg), std::invalid_argument);
    cfg.jobs = 65;
    EXPECT_THROW(tqeval_app::validate_config(cfg), std::invalid_argument);

    cfg = create_valid_config();
    cfg.tfidf_min_token_length = 0;
    EXPECT_THROW(tqeval_app::validate_config(cfg), std::invalid_argument);

    cfg = create_valid_config();
    cfg.report_format = "csv";
    EXPECT_THROW(tqeval_app::validate_config(cfg), std::invalid_argument);
    EXPECT_THROW({ tqeval_app app(cfg, out); }, std::invalid_argument);
}

TEST_F(TqevalAppTest, CommandLineParsing) {
    const char* argv1[] = {
        "tqeval",
        "--texts", "/data/texts",
        "--latency", "/data/perf.json",
        "--output", "report.txt",
        "--format", "txt",
        "--jobs", "4",
        "--wer", "0.2",
        "--cer", "0.05",
        "--tfidf", "0.6",
        "--latency-ms", "1000",
        "--rtf", "1",
        "--keep-punctuation",
        "--no-ascii-fold",
        "--log-level", "debug",
        "--log-file"
    };
    int argc1 = sizeof(argv1) / sizeof(argv1[0]);

    auto cfg = tqeval_app::parse_command_line(argc1, const_cast<char**>(argv1));

    EXPECT_EQ(cfg.texts_dir, "/data/texts");
    EXPECT_EQ(cfg.latency_file, "/data/perf.json");
    EXPECT_EQ(cfg.output_file, "report.txt");
    EXPECT_EQ(cfg.report_format, "txt");
    EXPECT_EQ(cfg.jobs, 4);
    EXPECT_DOUBLE_EQ(cfg.wer_threshold, 0.2);
    EXPECT_DOUBLE_EQ(cfg.cer_threshold, 0.05);
    EXPECT_DOUBLE_EQ(cfg.tfidf_threshold, 0.6);
    EXPECT_DOUBLE_EQ(cfg.latency_threshold_ms, 1000.0);
    EXPECT_DOUBLE_EQ(cfg.rtf_threshold, 1.0);
    EXPECT_FALSE(cfg.strip_punctuation);
    EXPECT_FALSE(cfg.ascii_fold);
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_TRUE(cfg.log_to_file);

    const char* argv2[] = {"tqeval", "--unknown-option"};
    EXPECT_THROW(tqeval_app::parse_command_line(2, const_cast<char**>(argv2)), std::invalid_argument);

    const char* argv3[] = {"tqeval", "--wer", "low"};
    EXPECT_THROW(tqeval_app::parse_command_line(3, const_cast<char**>(argv3)), std::invalid_argument);

    const char* argv4[] = {"tqeval", "--jobs", "2x"};
    EXPECT_THROW(tqeval_app::parse_command_line(3, const_cast<char**>(argv4)), std::invalid_argument);

    const char* argv5[] = {"tqeval", "--texts"};
    EXPECT_THROW(tqeval_app::parse_command_line(2, const_cast<char**>(argv5)), std::invalid_argument);

    const char* argv6[] = {"tqeval", "--tfidf-min-token-length", "2"};
    EXPECT_EQ(tqeval_app::parse_command_line(3, const_cast<char**>(argv6)).tfidf_min_token_length, 2u);

    const char* argv7[] = {"tqeval", "--tfidf-min-token-length", "0"};
    EXPECT_THROW(tqeval_app::parse_command_line(3, const_cast<char**>(argv7)), std::invalid_argument);
}

TEST_F(TqevalAppTest, CommandLineOverridesLoadedSettings) {
    eval_config base;
    base.wer_threshold = 0.3;
    base.cer_threshold = 0.2;
    base.transcriptor.name = "from-env";

    const char* argv[] = {"tqeval", "--wer", "0.1"};
    auto cfg = tqeval_app::parse_command_line(3, const_cast<char**>(argv), base);

    EXPECT_DOUBLE_EQ(cfg.wer_threshold, 0.1);
    EXPECT_DOUBLE_EQ(cfg.cer_threshold, 0.2);
    EXPECT_EQ(cfg.transcriptor.name, "from-env");
}

TEST_F(TqevalAppTest, FindEnvFile) {
    const char* argv1[] = {"tqeval", "--env-file", "custom.env"};
    EXPECT_EQ(tqeval_app::find_env_file(3, const_cast<char**>(argv1)), "custom.env");

    const char* argv2[] = {"tqeval", "--texts", "dir"};
    EXPECT_EQ(tqeval_app::find_env_file(3, const_cast<char**>(argv2)), ".env");
}

TEST_F(TqevalAppTest, AllTranscriptsPass) {
    tqeval_app app(create_valid_config(), out);

    EXPECT_EQ(app.run(), tqeval_app::exit_passed);
    ASSERT_EQ(app.records().size(), 1u);
    EXPECT_TRUE(app.records()[0].overall_passed);
    EXPECT_THAT(out.str(), HasSubstr("[transcript1] PASSED (4/4 metrics passed)"));
    EXPECT_THAT(out.str(), HasSubstr("Overall: PASSED"));
}

TEST_F(TqevalAppTest, FailingTranscriptGivesExitOne) {
    write_file(texts_dir / "transcript2.txt", "the weather nice today");
    tqeval_app app(create_valid_config(), out);

    EXPECT_EQ(app.run(), tqeval_app::exit_failed);
    ASSERT_EQ(app.records().size(), 2u);
    EXPECT_EQ(app.records()[1].name, "transcript2");
    EXPECT_TRUE(app.records()[1].performance_missing);
    EXPECT_FALSE(app.records()[1].overall_passed);
}

TEST_F(TqevalAppTest, PunctuationMattersWhenKept) {
    auto cfg = create_valid_config();
    cfg.strip_punctuation = false;
    tqeval_app app(cfg, out);

    EXPECT_EQ(app.run(), tqeval_app::exit_failed);
    EXPECT_GT(app.records()[0].metrics.at(metric_id::word_error_rate), 0.0);
}

TEST_F(TqevalAppTest, MissingGroundTruthAborts) {
    fs::remove_all(texts_dir / "gt");
    tqeval_app app(create_valid_config(), out);

    EXPECT_EQ(app.run(), tqeval_app::exit_aborted);
    EXPECT_TRUE(app.records().empty());
}

TEST_F(TqevalAppTest, MissingTextsDirectoryAborts) {
    auto cfg = create_valid_config();
    cfg.texts_dir = (texts_dir / "absent").string();
    tqeval_app app(cfg, out);

    EXPECT_EQ(app.run(), tqeval_app::exit_aborted);
}

TEST_F(TqevalAppTest, WritesJsonReport) {
    auto cfg = create_valid_config();
    cfg.output_file = (texts_dir / "report.json").string();
    cfg.transcriptor.name = "vosk";
    tqeval_app app(cfg, out);

    ASSERT_EQ(app.run(), tqeval_app::exit_passed);

    std::ifstream file(cfg.output_file);
    ASSERT_TRUE(file.is_open());
    auto report = json::parse(file);
    EXPECT_EQ(report["transcriptor"]["name"], "vosk");
    EXPECT_EQ(report["records"][0]["name"], "transcript1");
    EXPECT_DOUBLE_EQ(report["records"][0]["metrics"]["latency_ms"].get<double>(), 650.0);
    EXPECT_TRUE(report["summary"]["all_passed"].get<bool>());
}

TEST_F(TqevalAppTest, ParallelRunMatchesSequential) {
    for (int i = 2; i <= 8; ++i) {
        write_file(texts_dir / ("transcript" + std::to_string(i) + ".txt"),
                   i % 2 == 0 ? "the weather is nice today" : "weather nice");
    }

    std::ostringstream sequential_out;
    tqeval_app sequential(create_valid_config(), sequential_out);
    sequential.run();

    auto cfg = create_valid_config();
    cfg.jobs = 4;
    tqeval_app parallel(cfg, out);
    parallel.run();

    EXPECT_EQ(out.str(), sequential_out.str());
}
