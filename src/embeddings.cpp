#include "embeddings.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

Embeddings::Embeddings(const Eigen::MatrixXf& table, const GeneratorConfig& config)
    : _table(table), _config(config) {}

Eigen::RowVectorXf Embeddings::positional_encoding(int position) const {
    const int H = _config.hidden_dim;
    Eigen::RowVectorXf pe(H);
    for (int i = 0; i < H; i += 2) {
        const double div = std::pow(10000.0, static_cast<double>(i) / H);
        pe(i) = static_cast<float>(std::sin(position / div));
        if (i + 1 < H) pe(i + 1) = static_cast<float>(std::cos(position / div));
    }
    return pe;
}

HiddenState Embeddings::encode(const TokenBatch& tokens, int start_position) const {
    if (tokens.empty()) {
        throw std::runtime_error("Cannot embed an empty batch");
    }
    if (start_position < 0) {
        throw std::runtime_error("Negative start position " + std::to_string(start_position));
    }

    const int T = tokens.front().size();
    const float scale = std::sqrt(static_cast<float>(_config.hidden_dim));

    std::vector<Eigen::MatrixXf> rows;
    rows.reserve(tokens.size());
    for (size_t b = 0; b < tokens.size(); ++b) {
        if (static_cast<int>(tokens[b].size()) != T) {
            std::ostringstream oss;
            oss << "Token batch row " << b << " has " << tokens[b].size() << " tokens, row 0 has " << T
                << "; pad the batch first";
            throw std::runtime_error(oss.str());
        }

        Eigen::MatrixXf x(T, _config.hidden_dim);
        for (int t = 0; t < T; ++t) {
            const int id = tokens[b][t];
            if (id < 0 || id >= _table.rows()) {
                std::ostringstream oss;
                oss << "Token id " << id << " at [" << b << ", " << t << "] is outside the vocabulary of "
                    << _table.rows();
                throw std::runtime_error(oss.str());
            }
            x.row(t) = _table.row(id) * scale + positional_encoding(start_position + t);
        }
        rows.push_back(std::move(x));
    }
    return HiddenState(std::move(rows));
}

PaddingMask Embeddings::padding_mask(const TokenBatch& tokens) const {
    PaddingMask mask;
    mask.reserve(tokens.size());
    for (const auto& row : tokens) {
        std::vector<bool> flags(row.size());
        for (size_t t = 0; t < row.size(); ++t) flags[t] = row[t] == _config.pad_id;
        mask.push_back(std::move(flags));
    }
    return mask;
}

TokenBatch Embeddings::pad_batch(const TokenBatch& ragged) const {
    size_t longest = 0;
    for (size_t b = 0; b < ragged.size(); ++b) {
        if (ragged[b].empty()) {
            throw std::runtime_error("Token batch row " + std::to_string(b) + " is empty");
        }
        longest = std::max(longest, ragged[b].size());
    }

    TokenBatch padded = ragged;
    for (auto& row : padded) row.resize(longest, _config.pad_id);
    return padded;
}
