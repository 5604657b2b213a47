#include <gtest/gtest.h>
#include "utils/config.hpp"
#include "test_utils.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

TEST(GeneratorConfigTest, DefaultsAreValid) {
    GeneratorConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.head_dim(), 32);
}

TEST(GeneratorConfigTest, RejectsHiddenSizeNotDivisibleByHeads) {
    GeneratorConfig config = test_utils::small_config();
    config.n_heads = 5;
    EXPECT_THROW(config.validate(), std::runtime_error);
}

TEST(GeneratorConfigTest, RejectsDropoutOutOfRange) {
    GeneratorConfig config = test_utils::small_config();
    config.dropout = 1.0f;
    EXPECT_THROW(config.validate(), std::runtime_error);
    config.dropout = -0.1f;
    EXPECT_THROW(config.validate(), std::runtime_error);
}

TEST(GeneratorConfigTest, RejectsSpecialIdsOutsideVocabulary) {
    GeneratorConfig config = test_utils::small_config();
    config.eos_id = config.vocab_size;
    EXPECT_THROW(config.validate(), std::runtime_error);
}

TEST(GeneratorConfigTest, RejectsMaxLenWithoutRoomToGenerate) {
    GeneratorConfig config = test_utils::small_config();
    config.max_len = 1;
    EXPECT_THROW(config.validate(), std::runtime_error);
}

TEST(InitConfigTest, ParsesSeedsInRange) {
    EXPECT_EQ(parse_seed("0"), 0u);
    EXPECT_EQ(parse_seed("1234"), 1234u);
    EXPECT_EQ(parse_seed("4294967295"), 4294967295u);
}

TEST(InitConfigTest, RejectsSeedsThatWouldWrap) {
    EXPECT_THROW(parse_seed("-3"), std::runtime_error);
    EXPECT_THROW(parse_seed("+3"), std::runtime_error);
    EXPECT_THROW(parse_seed("4294967296"), std::runtime_error);
    EXPECT_THROW(parse_seed("99999999999999999999999"), std::runtime_error);
    EXPECT_THROW(parse_seed("12abc"), std::runtime_error);
    EXPECT_THROW(parse_seed(""), std::runtime_error);
}

namespace {

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        const std::string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        path = fs::temp_directory_path() / ("seqgan_" + name + ".json");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path, ec);
    }

    void write(const std::string& text) const {
        std::ofstream out(path);
        out << text;
    }

    fs::path path;
};

}

TEST_F(ConfigFileTest, ReadsKeysFromAnyGroup) {
    write(R"({
        "model": {"vocab_size": 50, "hidden_dim": 32, "n_heads": 4, "pff_dim": 64, "n_layers": 2,
                  "activation": "gelu", "use_cross_attention": false},
        "tokens": {"pad_id": 1, "unk_id": 0, "eos_id": 4},
        "generation": {"max_len": 20},
        "train": {"batch_size": 32, "lr": 0.0005}
    })");

    GeneratorConfig config = load_config(path.string());
    EXPECT_EQ(config.vocab_size, 50);
    EXPECT_EQ(config.hidden_dim, 32);
    EXPECT_EQ(config.n_heads, 4);
    EXPECT_EQ(config.pff_dim, 64);
    EXPECT_EQ(config.n_layers, 2);
    EXPECT_EQ(config.activation, Activation::GELU);
    EXPECT_FALSE(config.use_cross_attention);
    EXPECT_EQ(config.pad_id, 1);
    EXPECT_EQ(config.unk_id, 0);
    EXPECT_EQ(config.eos_id, 4);
    EXPECT_EQ(config.max_len, 20);

    // Untouched keys keep their defaults.
    EXPECT_EQ(config.bos_id, GeneratorConfig{}.bos_id);
    EXPECT_FLOAT_EQ(config.dropout, GeneratorConfig{}.dropout);
}

TEST_F(ConfigFileTest, LoadedConfigIsValidated) {
    write(R"({"model": {"hidden_dim": 30, "n_heads": 4}})");
    EXPECT_THROW(load_config(path.string()), std::runtime_error);
}

TEST_F(ConfigFileTest, BadFilesAreRejected) {
    EXPECT_THROW(load_config((path.parent_path() / "seqgan_missing_config.json").string()), std::runtime_error);

    write(R"({"model": {"hidden_dim": "wide"}})");
    EXPECT_THROW(load_config(path.string()), std::runtime_error);

    write(R"({"model": {"activation": "tanh"}})");
    EXPECT_THROW(load_config(path.string()), std::runtime_error);

    write(R"({"model": )");
    EXPECT_THROW(load_config(path.string()), std::runtime_error);
}
