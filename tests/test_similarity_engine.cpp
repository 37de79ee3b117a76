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
#include "similarity_engine.h"
#include "text_normalizer.h"
#include <cmath>

using ::testing::DoubleNear;
using ::testing::Pair;
using ::testing::UnorderedElementsAre;

class SimilarityEngineTest : public ::testing::Test {
protected:
    std::vector<std::string> words(const std::string& text) {
        return text_normalizer::split_words(text);
    }

    similarity_engine engine;
};

TEST_F(SimilarityEngineTest, IdenticalTextsScoreExactlyOne) {
    const char* texts[] = {"the cat sat on the mat", "a a a b",
                           "speech to text quality check speech", "one"};
    for (const char* text : texts) {
        EXPECT_EQ(engine.tfidf_similarity(text, text), 1.0) << text;
    }
}

TEST_F(SimilarityEngineTest, DisjointTextsScoreZero) {
    EXPECT_DOUBLE_EQ(engine.tfidf_similarity("alpha beta", "gamma delta"), 0.0);
}

TEST_F(SimilarityEngineTest, EmptySideScoresZero) {
    EXPECT_DOUBLE_EQ(engine.tfidf_similarity("", "something here"), 0.0);
    EXPECT_DOUBLE_EQ(engine.tfidf_similarity("something here", ""), 0.0);
    EXPECT_DOUBLE_EQ(engine.tfidf_similarity("", ""), 0.0);
}

TEST_F(SimilarityEngineTest, PartialOverlapIsStrictlyBetweenZeroAndOne) {
    const double similarity = engine.tfidf_similarity(words("the cat sat on the mat"),
                                                      words("a cat was sitting on a mat"));

    EXPECT_GT(similarity, 0.0);
    EXPECT_LT(similarity, 1.0);

    // Shared terms weigh 1, unshared terms 1 + ln(1.5)
    const double unshared = 1.0 + std::log(1.5);
    const double dot = 3.0;
    const double norm_ref = std::sqrt(3.0 + 4.0 * unshared * unshared + unshared * unshared);
    const double norm_hyp = std::sqrt(3.0 + 4.0 * unshared * unshared + 2.0 * unshared * unshared);
    EXPECT_NEAR(similarity, dot / (norm_ref * norm_hyp), 1e-12);
    EXPECT_NEAR(similarity, 0.2169338, 1e-6);
}

TEST_F(SimilarityEngineTest, SimilarityIsSymmetric) {
    const auto a = words("speech to text quality check");
    const auto b = words("speech text quality checks");

    EXPECT_NEAR(engine.tfidf_similarity(a, b), engine.tfidf_similarity(b, a), 1e-12);
}

TEST_F(SimilarityEngineTest, SmoothedIdf) {
    EXPECT_DOUBLE_EQ(similarity_engine::smoothed_idf(2, 2), 1.0);
    EXPECT_NEAR(similarity_engine::smoothed_idf(2, 1), 1.0 + std::log(1.5), 1e-12);
    EXPECT_NEAR(similarity_engine::smoothed_idf(4, 0), 1.0 + std::log(5.0), 1e-12);
}

TEST_F(SimilarityEngineTest, TfidfVectorUsesRawCounts) {
    const std::vector<std::vector<std::string>> corpus = {words("the the cat"), words("a cat")};
    auto vector = engine.tfidf_vector(corpus[0], corpus);

    EXPECT_THAT(vector, UnorderedElementsAre(Pair("cat", DoubleNear(1.0, 1e-12)),
                                             Pair("the", DoubleNear(2.0 * (1.0 + std::log(1.5)), 1e-12))));
}

TEST_F(SimilarityEngineTest, CosineOfZeroVectorIsZero) {
    similarity_engine::term_vector empty;
    similarity_engine::term_vector some = {{"x", 1.0}};

    EXPECT_DOUBLE_EQ(similarity_engine::cosine_similarity(empty, some), 0.0);
    EXPECT_DOUBLE_EQ(similarity_engine::cosine_similarity(some, some), 1.0);
}

TEST_F(SimilarityEngineTest, MinimumTokenLengthFiltersShortTokens) {
    similarity_engine::config cfg;
    cfg.min_token_length = 2;
    similarity_engine filtered(cfg);

    // Only "a" differs, and it is ignored
    EXPECT_EQ(filtered.tfidf_similarity("a cat on mat", "cat on mat"), 1.0);
    EXPECT_LT(engine.tfidf_similarity("a cat on mat", "cat on mat"), 1.0);
}

TEST_F(SimilarityEngineTest, JaccardSimilarity) {
    EXPECT_DOUBLE_EQ(similarity_engine::jaccard_similarity(words("a b c"), words("b c d")), 0.5);
    EXPECT_DOUBLE_EQ(similarity_engine::jaccard_similarity({}, {}), 1.0);
    EXPECT_DOUBLE_EQ(similarity_engine::jaccard_similarity(words("a"), {}), 0.0);
    EXPECT_DOUBLE_EQ(similarity_engine::jaccard_similarity(words("a a b"), words("b a")), 1.0);
}

TEST_F(SimilarityEngineTest, LevenshteinSimilarity) {
    const auto kitten = text_normalizer::split_code_points("kitten");
    const auto sitting = text_normalizer::split_code_points("sitting");

    EXPECT_NEAR(similarity_engine::levenshtein_similarity(kitten, sitting), 1.0 - 3.0 / 7.0, 1e-12);
    EXPECT_DOUBLE_EQ(similarity_engine::levenshtein_similarity({}, {}), 1.0);
    EXPECT_DOUBLE_EQ(similarity_engine::levenshtein_similarity(kitten, {}), 0.0);
}
