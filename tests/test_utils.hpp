#pragma once
#include <gtest/gtest.h>
#include <Eigen/Dense>

#include "hidden_state.hpp"
#include "utils/config.hpp"

#include <algorithm>
#include <random>
#include <vector>

namespace test_utils {

// Small enough to run in milliseconds, large enough for several heads and layers.
inline GeneratorConfig small_config() {
    GeneratorConfig config;
    config.vocab_size = 24;
    config.hidden_dim = 16;
    config.n_heads = 4;
    config.pff_dim = 32;
    config.n_layers = 3;
    config.max_len = 10;
    return config;
}

// Larger than the 0.02 default so attention patterns are far from uniform.
inline InitConfig test_init(std::uint32_t seed = 7) {
    InitConfig init;
    init.seed = seed;
    init.stddev = 0.3f;
    return init;
}

inline Eigen::MatrixXf random_matrix(int rows, int cols, std::mt19937& rng) {
    std::normal_distribution<float> nd(0.0f, 1.0f);
    Eigen::MatrixXf m(rows, cols);
    for (int i = 0; i < rows; ++i) for (int j = 0; j < cols; ++j) m(i, j) = nd(rng);
    return m;
}

inline HiddenState random_state(int batch, int seq_len, int hidden_dim, std::uint32_t seed) {
    std::mt19937 rng(seed);
    std::vector<Eigen::MatrixXf> rows;
    for (int b = 0; b < batch; ++b) rows.push_back(random_matrix(seq_len, hidden_dim, rng));
    return HiddenState(std::move(rows));
}

// |a - b| <= tol * (1 + max|b|), elementwise
inline ::testing::AssertionResult matrices_near(const Eigen::MatrixXf& a, const Eigen::MatrixXf& b,
                                                float tol = 1e-5f) {
    if (a.rows() != b.rows() || a.cols() != b.cols()) {
        return ::testing::AssertionFailure() << "shape [" << a.rows() << ", " << a.cols() << "] vs ["
                                             << b.rows() << ", " << b.cols() << "]";
    }
    if (!a.allFinite() || !b.allFinite()) {
        return ::testing::AssertionFailure() << "non-finite values";
    }
    const float bound = tol * (1.0f + b.cwiseAbs().maxCoeff());
    const float diff = (a - b).cwiseAbs().maxCoeff();
    if (diff > bound) {
        return ::testing::AssertionFailure() << "max abs diff " << diff << " exceeds " << bound;
    }
    return ::testing::AssertionSuccess();
}

}
