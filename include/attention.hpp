#pragma once
#include <Eigen/Dense>
#include "utils/layer_weights.hpp"

#include <random>
#include <vector>

struct AttentionOutput {
    Eigen::MatrixXf output;   // [Tq, H]
    Eigen::MatrixXf weights;  // [Tq, Tk], averaged over heads
};

// Multi-head scaled dot-product attention for one batch row.
//
// query is [Tq, H]; key and value are [Tk, H]. attn_mask, when given, is an
// additive [Tq, Tk] bias (see nn::causal_mask). key_padding_mask, when given,
// holds Tk flags and removes the flagged keys from every query's softmax.
// A query that ends up with no visible key produces a zero row.
//
// Attention dropout is only applied when rng is non-null.
AttentionOutput multi_head_attention(const Eigen::Ref<const Eigen::MatrixXf>& query,
                                     const Eigen::Ref<const Eigen::MatrixXf>& key,
                                     const Eigen::Ref<const Eigen::MatrixXf>& value,
                                     const AttentionWeights& attn,
                                     int n_heads,
                                     const Eigen::MatrixXf* attn_mask = nullptr,
                                     const std::vector<bool>* key_padding_mask = nullptr,
                                     float dropout_p = 0.0f,
                                     std::mt19937* rng = nullptr);
