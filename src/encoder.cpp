#include "encoder.hpp"
#include "attention.hpp"
#include "nn_ops.hpp"

Encoder::Encoder(const ModelWeights& model) : _model(model) {}

HiddenState Encoder::forward(const HiddenState& src,
                             const PaddingMask* src_padding_mask,
                             std::mt19937* dropout_rng) const {
    src.assert_shape(-1, -1, _model.config().hidden_dim, "src");
    if (src_padding_mask != nullptr) {
        tensor_utils::assert_mask_shape(*src_padding_mask, src.batch(), src.seq_len(), "src_padding_mask");
    }

    std::vector<Eigen::MatrixXf> rows;
    rows.reserve(src.batch());
    for (int b = 0; b < src.batch(); ++b) {
        Eigen::MatrixXf x = src[b];
        for (const auto& layer : _model.encoder_layers()) {
            x = forward_layer(layer, x, tensor_utils::mask_row(src_padding_mask, b), dropout_rng);
        }
        rows.push_back(std::move(x));
    }
    return HiddenState(std::move(rows));
}

Eigen::MatrixXf Encoder::forward_layer(const EncoderLayerWeights& layer,
                                       const Eigen::MatrixXf& x,
                                       const std::vector<bool>* padding,
                                       std::mt19937* rng) const {
    const auto& config = _model.config();
    const float p = config.dropout;

    Eigen::MatrixXf attended = multi_head_attention(
        x, x, x, layer.self_attn, config.n_heads, nullptr, padding, p, rng).output;
    Eigen::MatrixXf y = nn::layer_norm(x + nn::dropout(std::move(attended), p, rng),
                                       layer.norm1, config.layer_norm_eps);

    Eigen::MatrixXf ff = nn::feed_forward(y, layer.ff, config.activation, p, rng);
    return nn::layer_norm(y + nn::dropout(std::move(ff), p, rng), layer.norm2, config.layer_norm_eps);
}
