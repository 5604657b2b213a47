#include "decoder_layer.hpp"
#include "attention.hpp"
#include "nn_ops.hpp"

#include <sstream>
#include <stdexcept>

DecoderLayer::DecoderLayer(const DecoderLayerWeights& weights, const GeneratorConfig& config)
    : _weights(weights), _config(config) {}

HiddenState DecoderLayer::forward(const HiddenState& tgt,
                                  const HiddenState* memory,
                                  DecodeMode mode,
                                  const PaddingMask* tgt_padding_mask,
                                  const PaddingMask* memory_padding_mask,
                                  std::mt19937* dropout_rng) const {
    tgt.assert_shape(-1, -1, _config.hidden_dim, "tgt");
    return forward(tgt.views(), memory, mode, tgt_padding_mask, memory_padding_mask, dropout_rng);
}

HiddenState DecoderLayer::forward(const StateViews& tgt,
                                  const HiddenState* memory,
                                  DecodeMode mode,
                                  const PaddingMask* tgt_padding_mask,
                                  const PaddingMask* memory_padding_mask,
                                  std::mt19937* dropout_rng) const {
    if (tgt.empty() || tgt.front().rows() == 0) {
        throw std::runtime_error("DecoderLayer needs at least one target position");
    }
    const int batch = static_cast<int>(tgt.size());
    const int seq_len = static_cast<int>(tgt.front().rows());
    for (int b = 0; b < batch; ++b) {
        if (tgt[b].rows() != seq_len || tgt[b].cols() != _config.hidden_dim) {
            std::ostringstream oss;
            oss << "Dimension mismatch for 'tgt': batch row " << b << " is [" << tgt[b].rows() << ", "
                << tgt[b].cols() << "], expected [" << seq_len << ", " << _config.hidden_dim << "]";
            throw std::runtime_error(oss.str());
        }
    }
    if (tgt_padding_mask != nullptr) {
        tensor_utils::assert_mask_shape(*tgt_padding_mask, batch, seq_len, "tgt_padding_mask");
    }

    if (memory != nullptr) {
        if (!has_cross_attention()) {
            throw std::runtime_error("Memory was supplied to a decoder layer built without cross-attention");
        }
        memory->assert_shape(batch, -1, _config.hidden_dim, "memory");
        if (memory->seq_len() == 0) {
            throw std::runtime_error("Memory must hold at least one source position");
        }
        if (memory_padding_mask != nullptr) {
            tensor_utils::assert_mask_shape(*memory_padding_mask, memory->batch(), memory->seq_len(),
                                            "memory_padding_mask");
        }
    } else if (memory_padding_mask != nullptr) {
        throw std::runtime_error("memory_padding_mask given without memory");
    }

    // Depends only on T, so it is rebuilt per call and never cached.
    Eigen::MatrixXf causal;
    if (mode == DecodeMode::Full) causal = nn::causal_mask(seq_len);

    std::vector<Eigen::MatrixXf> rows;
    rows.reserve(batch);
    for (int b = 0; b < batch; ++b) {
        rows.push_back(forward_row(tgt[b],
                                   memory == nullptr ? nullptr : &(*memory)[b],
                                   mode,
                                   mode == DecodeMode::Full ? &causal : nullptr,
                                   tensor_utils::mask_row(tgt_padding_mask, b),
                                   tensor_utils::mask_row(memory_padding_mask, b),
                                   dropout_rng));
    }
    return HiddenState(std::move(rows));
}

Eigen::MatrixXf DecoderLayer::forward_row(const Eigen::Ref<const Eigen::MatrixXf>& tgt,
                                          const Eigen::MatrixXf* memory,
                                          DecodeMode mode,
                                          const Eigen::MatrixXf* causal,
                                          const std::vector<bool>* tgt_padding,
                                          const std::vector<bool>* memory_padding,
                                          std::mt19937* rng) const {
    const float p = _config.dropout;
    const float eps = _config.layer_norm_eps;

    // Incremental mode only queries the newest position, and that position may see
    // every earlier one, so no causal mask is needed there.
    Eigen::MatrixXf x = mode == DecodeMode::Full ? Eigen::MatrixXf(tgt) : Eigen::MatrixXf(tgt.bottomRows(1));

    // self attention
    Eigen::MatrixXf attended = multi_head_attention(
        x, tgt, tgt, _weights.self_attn, _config.n_heads, causal, tgt_padding, p, rng).output;
    x = nn::layer_norm(x + nn::dropout(std::move(attended), p, rng), _weights.norm1, eps);

    // encoder-decoder attention
    if (memory != nullptr) {
        attended = multi_head_attention(
            x, *memory, *memory, _weights.cross_attn, _config.n_heads, nullptr, memory_padding, p, rng).output;
        x = nn::layer_norm(x + nn::dropout(std::move(attended), p, rng), _weights.norm2, eps);
    }

    // final feed-forward network
    Eigen::MatrixXf ff = nn::feed_forward(x, _weights.ff, _config.activation, p, rng);
    x = nn::layer_norm(x + nn::dropout(std::move(ff), p, rng), _weights.norm3, eps);

    return x;
}
