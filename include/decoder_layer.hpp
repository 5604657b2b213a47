#pragma once
#include "hidden_state.hpp"
#include "utils/config.hpp"
#include "utils/layer_weights.hpp"

#include <random>

// Selected per call. The same layer serves teacher-forced scoring and
// token-by-token generation without any ambient training flag.
enum class DecodeMode {
    // Every position of tgt is recomputed under a causal mask. Output is (batch, T, H).
    Full,
    // Only the last position of tgt is new. It is the sole query; all T positions
    // are keys and values. Output is (batch, 1, H).
    Incremental,
};

// One post-norm transformer decoder block:
//   x = norm1(x + dropout(self_attn(x)))
//   x = norm2(x + dropout(cross_attn(x, memory)))   (skipped without memory)
//   x = norm3(x + dropout(ff(x)))
class DecoderLayer {
public:
    DecoderLayer(const DecoderLayerWeights& weights, const GeneratorConfig& config);

    // memory == nullptr runs the layer decoder-only: the cross-attention sublayer is skipped,
    // not masked. Supplying memory to a layer built without cross-attention is an error.
    //
    // tgt_padding_mask flags padded positions of tgt, memory_padding_mask those of memory.
    // Dropout is active only when dropout_rng is non-null.
    HiddenState forward(const HiddenState& tgt,
                        const HiddenState* memory,
                        DecodeMode mode,
                        const PaddingMask* tgt_padding_mask = nullptr,
                        const PaddingMask* memory_padding_mask = nullptr,
                        std::mt19937* dropout_rng = nullptr) const;

    // Same as above over states that live elsewhere; tgt[b] is read in place.
    HiddenState forward(const StateViews& tgt,
                        const HiddenState* memory,
                        DecodeMode mode,
                        const PaddingMask* tgt_padding_mask = nullptr,
                        const PaddingMask* memory_padding_mask = nullptr,
                        std::mt19937* dropout_rng = nullptr) const;

    bool has_cross_attention() const { return _config.use_cross_attention; }

private:
    Eigen::MatrixXf forward_row(const Eigen::Ref<const Eigen::MatrixXf>& tgt,
                                const Eigen::MatrixXf* memory,
                                DecodeMode mode,
                                const Eigen::MatrixXf* causal,
                                const std::vector<bool>* tgt_padding,
                                const std::vector<bool>* memory_padding,
                                std::mt19937* rng) const;

    const DecoderLayerWeights& _weights;
    GeneratorConfig _config;
};
