#include <gtest/gtest.h>
#include "utils/model_weights.hpp"
#include "test_utils.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

TEST(ModelWeightsTest, RandomInitIsReproducibleFromInitConfig) {
    GeneratorConfig config = test_utils::small_config();
    ModelWeights a(config);
    ModelWeights b(config);
    a.init_data_random(test_utils::test_init(5));
    b.init_data_random(test_utils::test_init(5));

    EXPECT_TRUE(a.tgt_embedding() == b.tgt_embedding());
    EXPECT_TRUE(a.decoder_layers()[2].cross_attn.qkv.weight == b.decoder_layers()[2].cross_attn.qkv.weight);
    EXPECT_TRUE(a.output_projection().weight == b.output_projection().weight);

    ModelWeights c(config);
    c.init_data_random(test_utils::test_init(6));
    EXPECT_FALSE(a.tgt_embedding() == c.tgt_embedding());
}

TEST(ModelWeightsTest, RandomInitHasExpectedShapes) {
    GeneratorConfig config = test_utils::small_config();
    ModelWeights weights(config);
    weights.init_data_random(InitConfig{});
    EXPECT_NO_THROW(weights.verify_sizes());

    EXPECT_EQ(weights.decoder_layers().size(), static_cast<size_t>(config.n_layers));
    EXPECT_EQ(weights.src_embedding().rows(), config.vocab_size);
    EXPECT_EQ(weights.decoder_layers()[0].ff.to_up.weight.cols(), config.pff_dim);
    EXPECT_TRUE(weights.decoder_layers()[0].norm1.gamma.isOnes());
}

TEST(ModelWeightsTest, VerifySizesNamesTheBadTensor) {
    GeneratorConfig config = test_utils::small_config();
    ModelWeights weights(config);
    weights.init_data_random(InitConfig{});
    weights.decoder_layers()[1].self_attn.out_proj.weight.resize(3, 3);

    try {
        weights.verify_sizes();
        FAIL() << "expected a shape error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("decoder.layers.1.self_attn.out_proj.weight"), std::string::npos);
    }
}

TEST(ModelWeightsTest, DecoderOnlyModelHasNoCrossAttention) {
    GeneratorConfig config = test_utils::small_config();
    config.use_cross_attention = false;
    ModelWeights weights(config);
    weights.init_data_random(InitConfig{});

    EXPECT_EQ(weights.decoder_layers()[0].cross_attn.qkv.weight.size(), 0);
    EXPECT_NO_THROW(weights.verify_sizes());
}

TEST(ModelWeightsTest, InvalidConfigIsRejectedAtConstruction) {
    GeneratorConfig config = test_utils::small_config();
    config.n_heads = 3;
    EXPECT_THROW(ModelWeights weights(config), std::runtime_error);
}

TEST(ModelWeightsTest, MissingWeightDirectoryReportsComponent) {
    ModelWeights weights(test_utils::small_config());
    const auto missing = std::filesystem::temp_directory_path() / "seqgan-no-such-weights";

    try {
        weights.load_weights(missing);
        FAIL() << "expected a load error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("Failed to load embeddings"), std::string::npos);
    }
}
