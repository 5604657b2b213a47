#include "hidden_state.hpp"
#include <sstream>
#include <stdexcept>

namespace {
    std::string shape_string(int batch, int seq_len, int hidden_dim) {
        std::ostringstream oss;
        oss << "[" << batch << ", " << seq_len << ", " << hidden_dim << "]";
        return oss.str();
    }
}

HiddenState::HiddenState(std::vector<Eigen::MatrixXf> rows) : _rows(std::move(rows)) {
    if (_rows.empty()) {
        throw std::runtime_error("HiddenState needs at least one batch row");
    }
    for (size_t b = 1; b < _rows.size(); ++b) {
        if (_rows[b].rows() != _rows[0].rows() || _rows[b].cols() != _rows[0].cols()) {
            std::ostringstream oss;
            oss << "Ragged HiddenState: batch row " << b << " is [" << _rows[b].rows() << ", "
                << _rows[b].cols() << "] but row 0 is [" << _rows[0].rows() << ", " << _rows[0].cols() << "]";
            throw std::runtime_error(oss.str());
        }
    }
}

HiddenState HiddenState::zeros(int batch, int seq_len, int hidden_dim) {
    return HiddenState(std::vector<Eigen::MatrixXf>(batch, Eigen::MatrixXf::Zero(seq_len, hidden_dim)));
}

StateViews HiddenState::views() const {
    StateViews views;
    views.reserve(_rows.size());
    for (const auto& row : _rows) views.emplace_back(row);
    return views;
}

HiddenState HiddenState::slice(int begin, int length) const {
    if (begin < 0 || length < 0 || begin + length > seq_len()) {
        std::ostringstream oss;
        oss << "Cannot slice positions [" << begin << ", " << begin + length << ") out of a sequence of length "
            << seq_len();
        throw std::runtime_error(oss.str());
    }
    std::vector<Eigen::MatrixXf> rows;
    rows.reserve(_rows.size());
    for (const auto& row : _rows) {
        rows.push_back(row.middleRows(begin, length));
    }
    return HiddenState(std::move(rows));
}

HiddenState HiddenState::concat(const HiddenState& front, const HiddenState& back) {
    if (front.empty()) return back;
    if (back.empty()) return front;

    if (front.batch() != back.batch() || front.hidden_dim() != back.hidden_dim()) {
        throw std::runtime_error("Cannot concatenate " +
            shape_string(front.batch(), front.seq_len(), front.hidden_dim()) + " with " +
            shape_string(back.batch(), back.seq_len(), back.hidden_dim()));
    }

    std::vector<Eigen::MatrixXf> rows;
    rows.reserve(front.batch());
    for (int b = 0; b < front.batch(); ++b) {
        Eigen::MatrixXf joined(front.seq_len() + back.seq_len(), front.hidden_dim());
        joined.topRows(front.seq_len()) = front[b];
        joined.bottomRows(back.seq_len()) = back[b];
        rows.push_back(std::move(joined));
    }
    return HiddenState(std::move(rows));
}

void HiddenState::assert_shape(int batch, int seq_len, int hidden_dim, const std::string& name) const {
    const bool ok = (batch < 0 || batch == this->batch()) &&
                    (seq_len < 0 || seq_len == this->seq_len()) &&
                    (hidden_dim < 0 || hidden_dim == this->hidden_dim());
    if (!ok) {
        std::ostringstream oss;
        oss << "Dimension mismatch for '" << name << "'.\n";
        oss << "Expected dimensions " << shape_string(batch, seq_len, hidden_dim) << " (-1 = any)\n";
        oss << "Got dimensions " << shape_string(this->batch(), this->seq_len(), this->hidden_dim()) << "\n";
        throw std::runtime_error(oss.str());
    }
}

namespace tensor_utils {
    void assert_mask_shape(const PaddingMask& mask, int batch, int length, const std::string& name) {
        if (static_cast<int>(mask.size()) != batch) {
            std::ostringstream oss;
            oss << "Padding mask '" << name << "' covers " << mask.size() << " batch rows, expected " << batch;
            throw std::runtime_error(oss.str());
        }
        for (int b = 0; b < batch; ++b) {
            if (static_cast<int>(mask[b].size()) != length) {
                std::ostringstream oss;
                oss << "Padding mask '" << name << "' row " << b << " has " << mask[b].size()
                    << " positions, expected " << length;
                throw std::runtime_error(oss.str());
            }
        }
    }
}
