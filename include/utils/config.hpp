#pragma once
#include <string>
#include <cstdint>

enum class Activation {
    ReLU,
    GELU,
};

// Hyperparameters of the encoder/decoder generator.
// Defaults follow the config the adversarial trainer shipped with.
struct GeneratorConfig {
    int vocab_size = 10000;
    int hidden_dim = 256;
    int n_heads = 8;
    int pff_dim = 512;
    int n_layers = 3;

    int pad_id = 0;
    int unk_id = 1;
    int bos_id = 2;
    int eos_id = 3;

    int max_len = 128;

    float dropout = 0.1f;
    float layer_norm_eps = 1e-5f;
    Activation activation = Activation::ReLU;

    // A decoder-only model never builds a cross-attention sublayer.
    bool use_cross_attention = true;

    // Throws std::runtime_error describing the first bad field.
    void validate() const;

    inline int head_dim() const {
        return hidden_dim / n_heads;
    }
};

// Random initialisation is driven entirely by this object, never by global state,
// so two models built from the same InitConfig are bit-identical.
struct InitConfig {
    std::uint32_t seed = 42;
    float stddev = 0.02f;
};

// Decimal seed in [0, 2^32). Signs, trailing characters and overflow are rejected.
std::uint32_t parse_seed(const std::string& text);

std::string describe(const GeneratorConfig& config);

// Reads a JSON config file of named groups, e.g.
//   {"model": {"hidden_dim": 256, "n_layers": 3}, "tokens": {"pad_id": 0}}
// Known keys are taken from whichever group holds them; everything else keeps its
// default. The result is validated before it is returned.
GeneratorConfig load_config(const std::string& path);

Activation parse_activation(const std::string& name);
