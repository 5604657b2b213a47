#pragma once
#include <Eigen/Dense>
#include <string>
#include <vector>

// Per-batch-row [T, H] views of states stored elsewhere, e.g. the rows of a
// LayerCache. Consumers read them in place; nothing is copied.
using StateViews = std::vector<Eigen::Ref<const Eigen::MatrixXf>>;

// (batch, T, H) token representations at one decoder depth.
// Stored as one [T, H] matrix per batch row (row = position), which is the
// layout every Eigen kernel in this project works on. All rows share T and H.
class HiddenState {
public:
    HiddenState() = default;

    // Throws std::runtime_error on an empty or ragged batch.
    explicit HiddenState(std::vector<Eigen::MatrixXf> rows);

    static HiddenState zeros(int batch, int seq_len, int hidden_dim);

    int batch() const { return static_cast<int>(_rows.size()); }
    int seq_len() const { return _rows.empty() ? 0 : static_cast<int>(_rows.front().rows()); }
    int hidden_dim() const { return _rows.empty() ? 0 : static_cast<int>(_rows.front().cols()); }
    bool empty() const { return _rows.empty(); }

    const Eigen::MatrixXf& operator[](int b) const { return _rows[b]; }
    const std::vector<Eigen::MatrixXf>& rows() const { return _rows; }
    StateViews views() const;

    // Positions [begin, begin + length) of every batch row.
    HiddenState slice(int begin, int length) const;

    // (batch, 1, H) view of the final position.
    HiddenState last_position() const { return slice(seq_len() - 1, 1); }

    // Concatenation along the time axis.
    static HiddenState concat(const HiddenState& front, const HiddenState& back);

    // -1 skips a dimension.
    void assert_shape(int batch, int seq_len, int hidden_dim, const std::string& name) const;

private:
    std::vector<Eigen::MatrixXf> _rows;
};

// true marks a padding position. One vector per batch row, one flag per position.
using PaddingMask = std::vector<std::vector<bool>>;

namespace tensor_utils {
    void assert_mask_shape(const PaddingMask& mask, int batch, int length, const std::string& name);

    // Returns nullptr when no mask was supplied, otherwise the flags of batch row b.
    inline const std::vector<bool>* mask_row(const PaddingMask* mask, int b) {
        return mask == nullptr ? nullptr : &(*mask)[b];
    }
}
