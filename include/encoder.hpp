#pragma once
#include "hidden_state.hpp"
#include "utils/model_weights.hpp"

#include <random>

// Post-norm transformer encoder. Produces the memory the decoder cross-attends to.
class Encoder {
public:
    explicit Encoder(const ModelWeights& model);

    HiddenState forward(const HiddenState& src,
                        const PaddingMask* src_padding_mask = nullptr,
                        std::mt19937* dropout_rng = nullptr) const;

private:
    Eigen::MatrixXf forward_layer(const EncoderLayerWeights& layer,
                                  const Eigen::MatrixXf& x,
                                  const std::vector<bool>* padding,
                                  std::mt19937* rng) const;

    const ModelWeights& _model;
};
