#include "nn_ops.hpp"
#include <cmath>
#include <limits>

namespace nn {

Eigen::MatrixXf forward_linear(Eigen::MatrixXf x, const Linear& linear) {
    x = x * linear.weight;
    x.rowwise() += linear.bias;
    return x;
}

Eigen::RowVectorXf softmax(const Eigen::RowVectorXf& x) {
    const float max = x.size() == 0 ? -std::numeric_limits<float>::infinity() : x.maxCoeff();
    if (max == -std::numeric_limits<float>::infinity()) {
        return Eigen::RowVectorXf::Zero(x.size());
    }
    Eigen::RowVectorXf exp_x = (x.array() - max).exp();  // for numerical stability
    return exp_x / exp_x.sum();
}

Eigen::MatrixXf layer_norm(Eigen::MatrixXf x, const LayerNormWeights& ln, float eps) {
    for (int i = 0; i < x.rows(); ++i) { // iterate over all tokens
        float mean = x.row(i).mean();
        float variance = (x.row(i).array() - mean).square().sum() / x.cols();
        float denom = 1.0f / std::sqrt(variance + eps);
        x.row(i) = ((x.row(i).array() - mean) * denom) * ln.gamma.array() + ln.beta.array();
    }
    return x;
}

Eigen::MatrixXf relu(Eigen::MatrixXf x) {
    return x.cwiseMax(0.0f);
}

namespace {
    // exact (erf) gelu, the torch default
    float _gelu(float x) {
        return 0.5f * x * (1.0f + std::erf(x / std::sqrt(2.0f)));
    }
}

Eigen::MatrixXf gelu(Eigen::MatrixXf x) { return x.unaryExpr(&_gelu); }

Eigen::MatrixXf activate(Eigen::MatrixXf x, Activation activation) {
    switch (activation) {
        case Activation::ReLU: return relu(std::move(x));
        case Activation::GELU: return gelu(std::move(x));
    }
    return x;
}

Eigen::MatrixXf dropout(Eigen::MatrixXf x, float p, std::mt19937* rng) {
    if (rng == nullptr || p <= 0.0f) return x;

    std::bernoulli_distribution keep(1.0 - p);
    const float scale = 1.0f / (1.0f - p);
    for (int i = 0; i < x.rows(); ++i) for (int j = 0; j < x.cols(); ++j) {
        x(i, j) = keep(*rng) ? x(i, j) * scale : 0.0f;
    }
    return x;
}

Eigen::MatrixXf feed_forward(Eigen::MatrixXf x, const FeedForwardWeights& ff, Activation activation,
                             float dropout_p, std::mt19937* rng) {
    x = forward_linear(std::move(x), ff.to_up);
    x = activate(std::move(x), activation);
    x = dropout(std::move(x), dropout_p, rng);
    return forward_linear(std::move(x), ff.back_down);
}

Eigen::MatrixXf causal_mask(int seq_len) {
    Eigen::MatrixXf mask = Eigen::MatrixXf::Zero(seq_len, seq_len);
    // mask(i, j) is how much token i may attend to token j
    for (int i = 0; i < seq_len; i++) {
        for (int j = i + 1; j < seq_len; j++) {
            mask(i, j) = -std::numeric_limits<float>::infinity();
        }
    }
    return mask;
}

}
