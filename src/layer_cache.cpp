#include "layer_cache.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

void LayerCache::reserve(int steps) {
    _capacity_hint = std::max(_capacity_hint, steps);
    for (auto& buffer : _buffers) {
        if (buffer.rows() < steps) buffer.conservativeResize(steps, Eigen::NoChange);
    }
}

LayerCache::LayerCache(LayerCache&& other) noexcept
    : _buffers(std::move(other._buffers)),
      _batch(std::exchange(other._batch, 0)),
      _hidden_dim(std::exchange(other._hidden_dim, 0)),
      _steps(std::exchange(other._steps, 0)),
      _staged(std::exchange(other._staged, 0)),
      _capacity_hint(std::exchange(other._capacity_hint, 0)) {
    other._buffers.clear();
}

LayerCache& LayerCache::operator=(LayerCache&& other) noexcept {
    if (this != &other) {
        _buffers = std::move(other._buffers);
        other._buffers.clear();
        _batch = std::exchange(other._batch, 0);
        _hidden_dim = std::exchange(other._hidden_dim, 0);
        _steps = std::exchange(other._steps, 0);
        _staged = std::exchange(other._staged, 0);
        _capacity_hint = std::exchange(other._capacity_hint, 0);
    }
    return *this;
}

void LayerCache::stage(const HiddenState& states) {
    _staged = 0;
    if (states.empty()) return;

    if (_steps == 0 && (states.batch() != _batch || states.hidden_dim() != _hidden_dim)) {
        // Nothing committed yet, so the shape is still open.
        _batch = states.batch();
        _hidden_dim = states.hidden_dim();
        _buffers.assign(_batch, Eigen::MatrixXf(std::max(_capacity_hint, states.seq_len()), _hidden_dim));
    } else if (states.batch() != _batch || states.hidden_dim() != _hidden_dim) {
        std::ostringstream oss;
        oss << "Cannot append [" << states.batch() << ", " << states.seq_len() << ", " << states.hidden_dim()
            << "] to a layer cache of batch " << _batch << " and hidden size " << _hidden_dim;
        throw std::runtime_error(oss.str());
    }

    const int needed = _steps + states.seq_len();
    const int capacity = _buffers.front().rows();
    if (needed > capacity) reserve(std::max(needed, 2 * capacity));

    for (int b = 0; b < _batch; ++b) {
        _buffers[b].middleRows(_steps, states.seq_len()) = states[b];
    }
    _staged = states.seq_len();
}

void LayerCache::commit() {
    _steps += _staged;
    _staged = 0;
}

void LayerCache::append(const HiddenState& states) {
    stage(states);
    commit();
}

StateViews LayerCache::view() const {
    StateViews views;
    views.reserve(_buffers.size());
    for (const auto& buffer : _buffers) {
        views.emplace_back(buffer.topRows(_steps + _staged));
    }
    return views;
}

HiddenState LayerCache::history() const {
    if (_buffers.empty()) return HiddenState();

    std::vector<Eigen::MatrixXf> rows;
    rows.reserve(_batch);
    for (const auto& buffer : _buffers) {
        rows.push_back(buffer.topRows(_steps));
    }
    return HiddenState(std::move(rows));
}

CacheStack::CacheStack(int num_layers, int reserve_steps) : _layers(num_layers) {
    if (num_layers <= 0) {
        throw std::runtime_error("CacheStack needs at least one layer, got " + std::to_string(num_layers));
    }
    _inputs.reserve(reserve_steps);
    for (auto& layer : _layers) layer.reserve(reserve_steps);
}
