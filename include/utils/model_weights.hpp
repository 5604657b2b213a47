#pragma once
#include "utils/config.hpp"
#include "utils/layer_weights.hpp"
#include <vector>
#include <stdexcept>
#include <filesystem>

class ModelWeights {
public:
    explicit ModelWeights(const GeneratorConfig& config);

    // Load all weights from a directory of .npy files, then verify their shapes.
    void load_weights(const std::filesystem::path& dir_path);

    void init_data_random(const InitConfig& init);

    // Throws std::runtime_error on the first tensor that disagrees with the config.
    void verify_sizes() const;

    // Getters for different components
    const Eigen::MatrixXf& src_embedding() const { return _src_emb; }
    const Eigen::MatrixXf& tgt_embedding() const { return _tgt_emb; }
    const std::vector<EncoderLayerWeights>& encoder_layers() const { return _encoder; }
    const std::vector<DecoderLayerWeights>& decoder_layers() const { return _decoder; }
    const Linear& output_projection() const { return _out; }

    // Mutable access for tests and for callers that patch individual tensors.
    std::vector<DecoderLayerWeights>& decoder_layers() { return _decoder; }
    std::vector<EncoderLayerWeights>& encoder_layers() { return _encoder; }
    Linear& output_projection() { return _out; }

    const GeneratorConfig& config() const { return _config; }

private:
    const GeneratorConfig _config;

    // Token embeddings [vocab_size, hidden_dim]
    Eigen::MatrixXf _src_emb;
    Eigen::MatrixXf _tgt_emb;

    std::vector<EncoderLayerWeights> _encoder;
    std::vector<DecoderLayerWeights> _decoder;

    // [hidden_dim, vocab_size]
    Linear _out;

    // Helper methods for loading specific components
    void load_embeddings(const std::filesystem::path& dir_path);
    void load_encoder_layer(int layer_idx, const std::filesystem::path& dir_path);
    void load_decoder_layer(int layer_idx, const std::filesystem::path& dir_path);
    void load_output_projection(const std::filesystem::path& dir_path);
};
