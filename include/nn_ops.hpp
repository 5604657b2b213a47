#pragma once
#include <Eigen/Dense>
#include "utils/config.hpp"
#include "utils/layer_weights.hpp"

#include <random>

// Row-wise building blocks shared by the encoder, the decoder and the output head.
// Every function treats its input as [T, C] with one token per row, so they
// behave identically whether they see a whole sequence or a single token.
namespace nn {
    Eigen::MatrixXf forward_linear(Eigen::MatrixXf x, const Linear& linear);

    // A row that is -inf everywhere (every key masked) yields all zeros instead of NaN.
    Eigen::RowVectorXf softmax(const Eigen::RowVectorXf& x);

    Eigen::MatrixXf layer_norm(Eigen::MatrixXf x, const LayerNormWeights& ln, float eps);

    Eigen::MatrixXf relu(Eigen::MatrixXf x);
    Eigen::MatrixXf gelu(Eigen::MatrixXf x);
    Eigen::MatrixXf activate(Eigen::MatrixXf x, Activation activation);

    // Inverted dropout. A null engine means evaluation and returns x untouched.
    Eigen::MatrixXf dropout(Eigen::MatrixXf x, float p, std::mt19937* rng);

    // linear2(dropout(act(linear1(x))))
    Eigen::MatrixXf feed_forward(Eigen::MatrixXf x, const FeedForwardWeights& ff, Activation activation,
                                 float dropout_p, std::mt19937* rng);

    // [T, T] additive bias: 0 on and below the diagonal, -inf above it.
    Eigen::MatrixXf causal_mask(int seq_len);
}
