#pragma once
#include "hidden_state.hpp"
#include "utils/layer_weights.hpp"

#include <vector>

// Hidden states to vocabulary logits.
class OutputProjection {
public:
    explicit OutputProjection(const Linear& projection);

    // One [T, vocab_size] matrix per batch row.
    std::vector<Eigen::MatrixXf> forward(const HiddenState& x) const;

    // Index of the largest logit in the final position of every batch row.
    // excluded_id, when in range, is never returned.
    std::vector<int> argmax_last(const HiddenState& x, int excluded_id = -1) const;

private:
    const Linear& _projection;
};
