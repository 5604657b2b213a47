#include "utils/model_weights.hpp"
#include "utils/weight_utils.hpp"
#include <filesystem>
#include <random>
#include <string>

namespace fs = std::filesystem;

ModelWeights::ModelWeights(const GeneratorConfig& config) : _config(config) {
    _config.validate();
    _encoder.resize(config.n_layers);
    _decoder.resize(config.n_layers);
}

// fs::path has no operator+, and every file name here is "<prefix>.<param>.npy".
template <typename T>
fs::path operator+(fs::path path, T&& data)
{
    path += std::forward<T>(data);
    return path;
}

namespace {
    void assert_linear(const Linear& input, int in_dim, int out_dim, const std::string& name) {
        weight_utils::assert_tensor_shape(input.weight, in_dim, out_dim, name + ".weight");
        weight_utils::assert_vector_shape(input.bias, out_dim, name + ".bias");
    }

    void assert_layer_norm(const LayerNormWeights& input, int size, const std::string& name) {
        weight_utils::assert_vector_shape(input.gamma, size, name + ".weight");
        weight_utils::assert_vector_shape(input.beta, size, name + ".bias");
    }

    void assert_attention(const AttentionWeights& attn, int hidden, const std::string& name) {
        assert_linear(attn.qkv, hidden, hidden * 3, name + ".qkv");
        assert_linear(attn.out_proj, hidden, hidden, name + ".out_proj");
    }

    void assert_feed_forward(const FeedForwardWeights& ff, int hidden, int pff, const std::string& name) {
        assert_linear(ff.to_up, hidden, pff, name + ".linear1");
        assert_linear(ff.back_down, pff, hidden, name + ".linear2");
    }

    // Weights ~ N(0, stddev), biases zero. The engine is owned by the caller so
    // that one InitConfig seeds the whole model in a fixed order.
    Eigen::MatrixXf random_2d(std::mt19937& rng, int rows, int cols, float stddev) {
        Eigen::MatrixXf res(rows, cols);
        std::normal_distribution<float> nd(0.0f, stddev);

        for (int i = 0; i < rows; ++i) for (int j = 0; j < cols; ++j) {
            res(i, j) = nd(rng);
        }
        return res;
    }

    Linear random_linear(std::mt19937& rng, int rows, int cols, float stddev) {
        return Linear{
            .weight = random_2d(rng, rows, cols, stddev),
            .bias = Eigen::RowVectorXf::Zero(cols)
        };
    }

    LayerNormWeights identity_ln(int size) {
        return LayerNormWeights{
            .gamma = Eigen::RowVectorXf::Ones(size),
            .beta = Eigen::RowVectorXf::Zero(size)
        };
    }

    AttentionWeights random_attention(std::mt19937& rng, int hidden, float stddev) {
        return AttentionWeights{
            .qkv = random_linear(rng, hidden, hidden * 3, stddev),
            .out_proj = random_linear(rng, hidden, hidden, stddev)
        };
    }

    FeedForwardWeights random_feed_forward(std::mt19937& rng, int hidden, int pff, float stddev) {
        return FeedForwardWeights{
            .to_up = random_linear(rng, hidden, pff, stddev),
            .back_down = random_linear(rng, pff, hidden, stddev)
        };
    }

    Linear load_linear(const fs::path& prefix) {
        return Linear{
            .weight = weight_utils::load_2d_tensor(prefix + ".weight.npy"),
            .bias = weight_utils::load_1d_tensor(prefix + ".bias.npy")
        };
    }

    LayerNormWeights load_layer_norm(const fs::path& prefix) {
        return LayerNormWeights{
            .gamma = weight_utils::load_1d_tensor(prefix + ".weight.npy"),
            .beta = weight_utils::load_1d_tensor(prefix + ".bias.npy")
        };
    }

    AttentionWeights load_attention(const fs::path& prefix) {
        return AttentionWeights{
            .qkv = load_linear(prefix + ".qkv"),
            .out_proj = load_linear(prefix + ".out_proj")
        };
    }

    FeedForwardWeights load_feed_forward(const fs::path& prefix) {
        return FeedForwardWeights{
            .to_up = load_linear(prefix + ".linear1"),
            .back_down = load_linear(prefix + ".linear2")
        };
    }
}

void ModelWeights::verify_sizes() const {
    const int H = _config.hidden_dim;
    const int F = _config.pff_dim;

    weight_utils::assert_tensor_shape(_src_emb, _config.vocab_size, H, "encoder.embedding");
    weight_utils::assert_tensor_shape(_tgt_emb, _config.vocab_size, H, "decoder.embedding");

    for (int layer_idx = 0; layer_idx < _config.n_layers; ++layer_idx) {
        const auto& enc = _encoder[layer_idx];
        const std::string enc_name = "encoder.layers." + std::to_string(layer_idx);
        assert_attention(enc.self_attn, H, enc_name + ".self_attn");
        assert_layer_norm(enc.norm1, H, enc_name + ".norm1");
        assert_feed_forward(enc.ff, H, F, enc_name);
        assert_layer_norm(enc.norm2, H, enc_name + ".norm2");

        const auto& dec = _decoder[layer_idx];
        const std::string dec_name = "decoder.layers." + std::to_string(layer_idx);
        assert_attention(dec.self_attn, H, dec_name + ".self_attn");
        assert_layer_norm(dec.norm1, H, dec_name + ".norm1");
        if (_config.use_cross_attention) {
            assert_attention(dec.cross_attn, H, dec_name + ".cross_attn");
            assert_layer_norm(dec.norm2, H, dec_name + ".norm2");
        }
        assert_feed_forward(dec.ff, H, F, dec_name);
        assert_layer_norm(dec.norm3, H, dec_name + ".norm3");
    }

    assert_linear(_out, H, _config.vocab_size, "generator");
}

void ModelWeights::init_data_random(const InitConfig& init) {
    std::mt19937 rng(init.seed);
    const int H = _config.hidden_dim;
    const int F = _config.pff_dim;

    _src_emb = random_2d(rng, _config.vocab_size, H, init.stddev);
    _tgt_emb = random_2d(rng, _config.vocab_size, H, init.stddev);

    for (int layer_idx = 0; layer_idx < _config.n_layers; ++layer_idx) {
        auto& enc = _encoder[layer_idx];
        enc.self_attn = random_attention(rng, H, init.stddev);
        enc.norm1 = identity_ln(H);
        enc.ff = random_feed_forward(rng, H, F, init.stddev);
        enc.norm2 = identity_ln(H);
    }

    for (int layer_idx = 0; layer_idx < _config.n_layers; ++layer_idx) {
        auto& dec = _decoder[layer_idx];
        dec.self_attn = random_attention(rng, H, init.stddev);
        dec.norm1 = identity_ln(H);
        if (_config.use_cross_attention) {
            dec.cross_attn = random_attention(rng, H, init.stddev);
            dec.norm2 = identity_ln(H);
        }
        dec.ff = random_feed_forward(rng, H, F, init.stddev);
        dec.norm3 = identity_ln(H);
    }

    _out = random_linear(rng, H, _config.vocab_size, init.stddev);
}

void ModelWeights::load_weights(const fs::path& dir_path) {
    load_embeddings(dir_path);

    for (int i = 0; i < _config.n_layers; i++) {
        load_encoder_layer(i, dir_path);
        load_decoder_layer(i, dir_path);
    }

    load_output_projection(dir_path);
    verify_sizes();
}

void ModelWeights::load_embeddings(const fs::path& dir_path) {
    try {
        _src_emb = weight_utils::load_2d_tensor(dir_path / "encoder.embedding.weight.npy");
        _tgt_emb = weight_utils::load_2d_tensor(dir_path / "decoder.embedding.weight.npy");
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load embeddings: " + std::string(e.what()));
    }
}

void ModelWeights::load_encoder_layer(int layer_idx, const fs::path& dir_path) {
    try {
        auto base_path = dir_path / "encoder.layers.";
        base_path += std::to_string(layer_idx);
        auto& layer = _encoder[layer_idx];

        layer.self_attn = load_attention(base_path + ".self_attn");
        layer.norm1 = load_layer_norm(base_path + ".norm1");
        layer.ff = load_feed_forward(base_path);
        layer.norm2 = load_layer_norm(base_path + ".norm2");
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load encoder layer " + std::to_string(layer_idx) + ": " + std::string(e.what()));
    }
}

void ModelWeights::load_decoder_layer(int layer_idx, const fs::path& dir_path) {
    try {
        auto base_path = dir_path / "decoder.layers.";
        base_path += std::to_string(layer_idx);
        auto& layer = _decoder[layer_idx];

        layer.self_attn = load_attention(base_path + ".self_attn");
        layer.norm1 = load_layer_norm(base_path + ".norm1");

        if (_config.use_cross_attention) {
            layer.cross_attn = load_attention(base_path + ".cross_attn");
            layer.norm2 = load_layer_norm(base_path + ".norm2");
        }

        layer.ff = load_feed_forward(base_path);
        layer.norm3 = load_layer_norm(base_path + ".norm3");
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load decoder layer " + std::to_string(layer_idx) + ": " + std::string(e.what()));
    }
}

void ModelWeights::load_output_projection(const fs::path& dir_path) {
    try {
        _out = load_linear(dir_path / "generator");
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load output projection: " + std::string(e.what()));
    }
}
