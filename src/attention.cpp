#include "attention.hpp"
#include "nn_ops.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace {
    using ConstRef = Eigen::Ref<const Eigen::MatrixXf>;

    void check_inputs(const ConstRef& query, const ConstRef& key, const ConstRef& value,
                      const AttentionWeights& attn, int n_heads,
                      const Eigen::MatrixXf* attn_mask, const std::vector<bool>* key_padding_mask) {
        const int C = query.cols();
        std::ostringstream oss;

        if (key.cols() != C || value.cols() != C || key.rows() != value.rows()) {
            oss << "Attention input mismatch: query [" << query.rows() << ", " << C << "], key ["
                << key.rows() << ", " << key.cols() << "], value [" << value.rows() << ", " << value.cols() << "]";
        } else if (attn.qkv.weight.rows() != C || attn.qkv.weight.cols() != 3 * C) {
            oss << "Attention weights expect hidden size " << attn.qkv.weight.rows() << " but inputs have " << C;
        } else if (n_heads <= 0 || C % n_heads != 0) {
            oss << "Hidden size " << C << " is not divisible into " << n_heads << " heads";
        } else if (attn_mask != nullptr && (attn_mask->rows() != query.rows() || attn_mask->cols() != key.rows())) {
            oss << "Attention mask is [" << attn_mask->rows() << ", " << attn_mask->cols() << "], expected ["
                << query.rows() << ", " << key.rows() << "]";
        } else if (key_padding_mask != nullptr && static_cast<int>(key_padding_mask->size()) != key.rows()) {
            oss << "Key padding mask has " << key_padding_mask->size() << " flags for " << key.rows() << " keys";
        } else {
            return;
        }
        throw std::runtime_error(oss.str());
    }
}

AttentionOutput multi_head_attention(const Eigen::Ref<const Eigen::MatrixXf>& query,
                                     const Eigen::Ref<const Eigen::MatrixXf>& key,
                                     const Eigen::Ref<const Eigen::MatrixXf>& value,
                                     const AttentionWeights& attn,
                                     int n_heads,
                                     const Eigen::MatrixXf* attn_mask,
                                     const std::vector<bool>* key_padding_mask,
                                     float dropout_p,
                                     std::mt19937* rng) {
    check_inputs(query, key, value, attn, n_heads, attn_mask, key_padding_mask);

    const int Tq = query.rows();
    const int Tk = key.rows();
    const int C = query.cols();
    const int head_dim = C / n_heads;

    // 1. Project. The packed [C, 3C] weight is split by column blocks so the
    //    query may come from a different sequence than the keys and values.
    Eigen::MatrixXf q = query * attn.qkv.weight.leftCols(C);
    q.rowwise() += attn.qkv.bias.head(C);
    Eigen::MatrixXf k = key * attn.qkv.weight.middleCols(C, C);
    k.rowwise() += attn.qkv.bias.segment(C, C);
    Eigen::MatrixXf v = value * attn.qkv.weight.rightCols(C);
    v.rowwise() += attn.qkv.bias.tail(C);

    Eigen::MatrixXf y = Eigen::MatrixXf::Zero(Tq, C);
    Eigen::MatrixXf mean_weights = Eigen::MatrixXf::Zero(Tq, Tk);

    const float scale = 1.0f / std::sqrt(static_cast<float>(head_dim));
    const float neg_inf = -std::numeric_limits<float>::infinity();

    for (int h = 0; h < n_heads; h++) {
        // Each block has shape [T, head_dim].
        Eigen::MatrixXf q_h = q.middleCols(h * head_dim, head_dim);
        Eigen::MatrixXf k_h = k.middleCols(h * head_dim, head_dim);
        Eigen::MatrixXf v_h = v.middleCols(h * head_dim, head_dim);

        // att_h(i, j) is how much query i attends to key j.
        Eigen::MatrixXf att_h = (q_h * k_h.transpose()) * scale;

        if (attn_mask != nullptr) att_h += *attn_mask;

        if (key_padding_mask != nullptr) {
            for (int j = 0; j < Tk; j++) {
                if ((*key_padding_mask)[j]) att_h.col(j).setConstant(neg_inf);
            }
        }

        for (int i = 0; i < Tq; i++) att_h.row(i) = nn::softmax(att_h.row(i));

        mean_weights += att_h;
        att_h = nn::dropout(std::move(att_h), dropout_p, rng);

        y.middleCols(h * head_dim, head_dim) = att_h * v_h;
    }

    AttentionOutput out;
    out.output = nn::forward_linear(std::move(y), attn.out_proj);
    out.weights = mean_weights / static_cast<float>(n_heads);
    return out;
}
