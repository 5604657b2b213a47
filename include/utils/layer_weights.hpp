#pragma once
#include <Eigen/Dense>

// Raw weights only; the forward passes live elsewhere so the same weights
// can serve the teacher-forced and the incremental decoder.

// Projects [in_dim => out_dim] as x * weight + bias.
// Bias is stored as a 1 x out_dim row vector so it broadcasts rowwise.
struct Linear {
    Eigen::MatrixXf weight;  // [in_dim, out_dim]
    Eigen::RowVectorXf bias; // [out_dim]
};

struct AttentionWeights {
    // Packed projection [H, 3 * H] => q, k, v column blocks.
    // Self-attention reads all three from the same input; cross-attention takes
    // q from the decoder and k, v from the encoder memory.
    Linear qkv;

    // Mixes the concatenated heads back together [H -> H].
    Linear out_proj;
};

struct FeedForwardWeights {
    // [H -> pff_dim -> H]
    Linear to_up;
    Linear back_down;
};

struct LayerNormWeights {
    Eigen::RowVectorXf gamma; // [H]
    Eigen::RowVectorXf beta;  // [H]
};

struct EncoderLayerWeights {
    AttentionWeights self_attn;
    LayerNormWeights norm1;
    FeedForwardWeights ff;
    LayerNormWeights norm2;
};

struct DecoderLayerWeights {
    AttentionWeights self_attn;
    LayerNormWeights norm1;

    // Left empty when the model is built without cross-attention.
    AttentionWeights cross_attn;
    LayerNormWeights norm2;

    FeedForwardWeights ff;
    LayerNormWeights norm3;
};
