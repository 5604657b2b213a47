#include "output_projection.hpp"
#include "nn_ops.hpp"

#include <limits>

OutputProjection::OutputProjection(const Linear& projection) : _projection(projection) {}

std::vector<Eigen::MatrixXf> OutputProjection::forward(const HiddenState& x) const {
    x.assert_shape(-1, -1, _projection.weight.rows(), "decoder output");

    std::vector<Eigen::MatrixXf> logits;
    logits.reserve(x.batch());
    for (const auto& row : x.rows()) {
        logits.push_back(nn::forward_linear(row, _projection));
    }
    return logits;
}

std::vector<int> OutputProjection::argmax_last(const HiddenState& x, int excluded_id) const {
    const HiddenState last = x.last_position();

    std::vector<int> tokens;
    tokens.reserve(last.batch());
    for (auto& logits : forward(last)) {
        if (0 <= excluded_id && excluded_id < logits.cols()) {
            logits(0, excluded_id) = -std::numeric_limits<float>::infinity();
        }
        Eigen::Index best = 0;
        logits.row(0).maxCoeff(&best);
        tokens.push_back(static_cast<int>(best));
    }
    return tokens;
}
