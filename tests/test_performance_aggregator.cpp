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
#include "performance_aggregator.h"
#include "eval_errors.h"

using json = nlohmann::json;

class PerformanceAggregatorTest : public ::testing::Test {
protected:
    json sample_map() {
        return json::parse(R"({
            "transcript1.txt": 650,
            "transcript2.txt": {"latency_ms": 420.5, "rtf": 0.35},
            "transcript3.txt": {"latency_ms": 900},
            "transcript4.txt": "275",
            "transcript5.txt": {"rtf": 0.2},
            "transcript6.txt": -10,
            "transcript7.txt": {"latency_ms": 100, "rtf": null}
        })");
    }
};

TEST_F(PerformanceAggregatorTest, BareNumberHasNoRtf) {
    auto metadata = performance_aggregator::parse_metadata(json(650));
    ASSERT_TRUE(std::holds_alternative<numeric_latency>(metadata));

    auto record = performance_aggregator::normalize(metadata);
    EXPECT_DOUBLE_EQ(record.latency_ms, 650.0);
    EXPECT_FALSE(record.rtf.has_value());
}

TEST_F(PerformanceAggregatorTest, DetailedEntryKeepsRtf) {
    auto metadata = performance_aggregator::parse_metadata(json{{"latency_ms", 420.5}, {"rtf", 0.35}});
    ASSERT_TRUE(std::holds_alternative<detailed_latency>(metadata));

    auto record = performance_aggregator::normalize(metadata);
    EXPECT_DOUBLE_EQ(record.latency_ms, 420.5);
    ASSERT_TRUE(record.rtf.has_value());
    EXPECT_DOUBLE_EQ(*record.rtf, 0.35);
}

TEST_F(PerformanceAggregatorTest, NumericStringIsAccepted) {
    auto record = performance_aggregator::normalize(performance_aggregator::parse_metadata(json("275")));
    EXPECT_DOUBLE_EQ(record.latency_ms, 275.0);
}

TEST_F(PerformanceAggregatorTest, InvalidEntriesAreRejected) {
    EXPECT_THROW(performance_aggregator::parse_metadata(json(-1)), missing_performance_data);
    EXPECT_THROW(performance_aggregator::parse_metadata(json("fast")), missing_performance_data);
    EXPECT_THROW(performance_aggregator::parse_metadata(json{{"rtf", 0.5}}), missing_performance_data);
    EXPECT_THROW(performance_aggregator::parse_metadata(json::array({1, 2})), missing_performance_data);
    EXPECT_THROW(performance_aggregator::parse_metadata(json{{"latency_ms", 10}, {"rtf", "slow"}}),
                 missing_performance_data);
}

TEST_F(PerformanceAggregatorTest, LookupByFileName) {
    auto aggregator = performance_aggregator::from_json(sample_map());

    EXPECT_EQ(aggregator.size(), 5u);
    EXPECT_EQ(aggregator.invalid_count(), 2u);

    auto first = aggregator.lookup("transcript1.txt");
    EXPECT_DOUBLE_EQ(first.latency_ms, 650.0);
    EXPECT_FALSE(first.rtf.has_value());

    auto third = aggregator.lookup("transcript3.txt");
    EXPECT_DOUBLE_EQ(third.latency_ms, 900.0);
    EXPECT_FALSE(third.rtf.has_value());

    auto seventh = aggregator.lookup("transcript7.txt");
    EXPECT_FALSE(seventh.rtf.has_value());

    EXPECT_TRUE(aggregator.contains("transcript2.txt"));
    EXPECT_FALSE(aggregator.contains("transcript5.txt"));
}

TEST_F(PerformanceAggregatorTest, MissingAndInvalidLookupsThrow) {
    auto aggregator = performance_aggregator::from_json(sample_map());

    EXPECT_THROW(aggregator.lookup("unknown.txt"), missing_performance_data);
    EXPECT_THROW(aggregator.lookup("transcript5.txt"), missing_performance_data);
    EXPECT_THROW(aggregator.lookup("transcript6.txt"), missing_performance_data);
}

TEST_F(PerformanceAggregatorTest, NonObjectRootIsIgnored) {
    EXPECT_EQ(performance_aggregator::from_json(json::array({1, 2, 3})).size(), 0u);
    EXPECT_EQ(performance_aggregator::from_json(json()).size(), 0u);
    EXPECT_EQ(performance_aggregator().size(), 0u);
}

TEST_F(PerformanceAggregatorTest, ConstructFromVariants) {
    std::map<std::string, latency_metadata> entries;
    entries["a.txt"] = numeric_latency{120.0};
    entries["b.txt"] = detailed_latency{300.0, 0.5};
    performance_aggregator aggregator(entries);

    EXPECT_DOUBLE_EQ(aggregator.lookup("a.txt").latency_ms, 120.0);
    EXPECT_DOUBLE_EQ(*aggregator.lookup("b.txt").rtf, 0.5);
}
