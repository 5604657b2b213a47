#include <gtest/gtest.h>
#include "generator.hpp"
#include "test_utils.hpp"

#include <limits>
#include <stdexcept>

namespace {

class GeneratorTest : public ::testing::Test {
protected:
    GeneratorTest() : config(test_utils::small_config()), weights(config) {
        weights.init_data_random(test_utils::test_init(21));
    }

    GeneratorConfig config;
    ModelWeights weights;
};

}

TEST_F(GeneratorTest, GenerateStartsWithBosAndHasMaxLen) {
    Generator generator(weights);
    TokenBatch out = generator.generate({{5, 6, 7}, {8, 9}}, 6);

    ASSERT_EQ(out.size(), 2u);
    for (const auto& row : out) {
        ASSERT_EQ(row.size(), 6u);
        EXPECT_EQ(row.front(), config.bos_id);
        for (int id : row) {
            EXPECT_GE(id, 0);
            EXPECT_LT(id, config.vocab_size);
        }
    }
}

TEST_F(GeneratorTest, CachedGenerationMatchesRecomputation) {
    Generator generator(weights);
    TokenBatch src = {{4, 5, 6, 7, 8}, {9, 10}, {11, 12, 13}};

    TokenBatch cached = generator.generate(src, 8);
    TokenBatch recomputed = generator.generate_without_cache(src, 8);
    EXPECT_EQ(cached, recomputed);
}

TEST_F(GeneratorTest, BatchedGenerationMatchesSingleRows) {
    Generator generator(weights);
    TokenBatch src = {{4, 5, 6, 7}, {14, 15}};

    TokenBatch together = generator.generate(src, 7);
    for (size_t b = 0; b < src.size(); ++b) {
        TokenBatch alone = generator.generate({src[b]}, 7);
        EXPECT_EQ(together[b], alone.front()) << "row " << b;
    }
}

TEST_F(GeneratorTest, FinishedRowsArePaddedAfterEos) {
    // Make eos the only sensible prediction.
    weights.output_projection().bias(config.eos_id) = 1e4f;
    Generator generator(weights);

    TokenBatch out = generator.generate({{4, 5}, {6}}, 5);
    for (const auto& row : out) {
        std::vector<int> expected = {config.bos_id, config.eos_id, config.pad_id, config.pad_id, config.pad_id};
        EXPECT_EQ(row, expected);
    }
    EXPECT_EQ(generator.generate_without_cache({{4, 5}, {6}}, 5), out);
}

TEST_F(GeneratorTest, UnfinishedRowsNeverEmitPad) {
    // Make pad the raw argmax everywhere.
    weights.output_projection().bias(config.pad_id) = 1e4f;
    Generator generator(weights);
    TokenBatch src = {{4, 5, 6}, {7, 8}};

    TokenBatch out = generator.generate(src, 6);
    for (const auto& row : out) {
        for (size_t t = 1; t < row.size() && row[t - 1] != config.eos_id; ++t) {
            EXPECT_NE(row[t], config.pad_id) << "position " << t;
        }
    }
    EXPECT_EQ(generator.generate_without_cache(src, 6), out);

    // Scoring the output sees every generated token, since none of them is pad.
    TokenBatch prefix;
    for (const auto& row : out) prefix.emplace_back(row.begin(), row.end() - 1);
    std::vector<Eigen::MatrixXf> logits = generator.forward(src, prefix);
    for (size_t b = 0; b < out.size(); ++b) {
        for (int t = 0; t < logits[b].rows() && out[b][t] != config.eos_id; ++t) {
            Eigen::RowVectorXf row = logits[b].row(t);
            row(config.pad_id) = -std::numeric_limits<float>::infinity();
            Eigen::Index best = 0;
            row.maxCoeff(&best);
            EXPECT_EQ(static_cast<int>(best), out[b][t + 1]) << "row " << b << " position " << t;
        }
    }
}

TEST_F(GeneratorTest, ForwardReturnsLogitsPerTargetPosition) {
    Generator generator(weights);
    std::vector<Eigen::MatrixXf> logits = generator.forward({{4, 5, 6}, {7}}, {{2, 8, 9, 10}, {2, 11}});

    ASSERT_EQ(logits.size(), 2u);
    for (const auto& row : logits) {
        EXPECT_EQ(row.rows(), 4);
        EXPECT_EQ(row.cols(), config.vocab_size);
        EXPECT_TRUE(row.allFinite());
    }
}

TEST_F(GeneratorTest, TeacherForcedLogitsMatchGreedyStepLogits) {
    Generator generator(weights);
    TokenBatch src = {{4, 5, 6}};
    TokenBatch out = generator.generate(src, 5);

    // Scoring the generated sequence must reproduce the greedy choices.
    TokenBatch prefix = {std::vector<int>(out[0].begin(), out[0].end() - 1)};
    std::vector<Eigen::MatrixXf> logits = generator.forward(src, prefix);
    for (int t = 0; t < logits[0].rows() && out[0][t] != config.eos_id; ++t) {
        Eigen::RowVectorXf row = logits[0].row(t);
        row(config.pad_id) = -std::numeric_limits<float>::infinity();
        Eigen::Index best = 0;
        row.maxCoeff(&best);
        EXPECT_EQ(static_cast<int>(best), out[0][t + 1]) << "position " << t;
    }
}

TEST_F(GeneratorTest, DecoderOnlyModelGenerates) {
    GeneratorConfig no_cross = config;
    no_cross.use_cross_attention = false;
    ModelWeights decoder_only(no_cross);
    decoder_only.init_data_random(test_utils::test_init(22));
    Generator generator(decoder_only);

    EXPECT_EQ(generator.generate({{4}}, 6), generator.generate_without_cache({{4}}, 6));
}

TEST_F(GeneratorTest, BadInputsAreRejected) {
    Generator generator(weights);
    EXPECT_THROW(generator.generate({{config.vocab_size}}, 4), std::runtime_error);
    EXPECT_THROW(generator.generate({{}}, 4), std::runtime_error);
    EXPECT_THROW(generator.generate({}, 4), std::runtime_error);
    EXPECT_THROW(generator.forward({{4}}, {{2}, {2}}), std::runtime_error);
}
