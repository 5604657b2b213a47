#pragma once
#include "hidden_state.hpp"
#include "utils/config.hpp"

#include <vector>

using TokenBatch = std::vector<std::vector<int>>;

// Token embedding scaled by sqrt(H) plus a sinusoidal positional encoding.
class Embeddings {
public:
    Embeddings(const Eigen::MatrixXf& table, const GeneratorConfig& config);

    // tokens must be rectangular (see pad_batch). Row b, column t is placed at absolute
    // position start_position + t, so a single token fed during generation is encoded
    // exactly as it would be inside the full sequence.
    HiddenState encode(const TokenBatch& tokens, int start_position = 0) const;

    // true where the token is pad_id.
    PaddingMask padding_mask(const TokenBatch& tokens) const;

    // Right-pads every row with pad_id to the longest row. Empty rows are an error.
    TokenBatch pad_batch(const TokenBatch& ragged) const;

    Eigen::RowVectorXf positional_encoding(int position) const;

private:
    const Eigen::MatrixXf& _table;
    GeneratorConfig _config;
};
