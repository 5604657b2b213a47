#pragma once
#include "hidden_state.hpp"

#include <vector>

// Append-only history of (batch, steps, H) states for one decoder depth.
// Each batch row owns a [capacity, H] buffer; only its first steps() rows are
// valid. Capacity doubles when exhausted, so appending a step does not
// reallocate the whole history every time.
//
// Rows can be staged past steps() and read in place through view() before they
// are committed, which lets a decoder step write its new position once and roll
// back for free when a later layer fails.
class LayerCache {
public:
    LayerCache() = default;
    LayerCache(const LayerCache&) = default;
    LayerCache& operator=(const LayerCache&) = default;

    // The source is left empty and shapeless.
    LayerCache(LayerCache&& other) noexcept;
    LayerCache& operator=(LayerCache&& other) noexcept;

    // Shape is adopted from the first append.
    int batch() const { return _batch; }
    int hidden_dim() const { return _hidden_dim; }
    int steps() const { return _steps; }
    bool empty() const { return _steps == 0; }

    // Grows every row buffer to hold at least `steps` steps. Before the first
    // append the request is remembered and applied when the shape is known.
    void reserve(int steps);

    // Writes states into the rows right after steps(), replacing anything staged
    // before. Throws on a batch or hidden size mismatch with committed history.
    void stage(const HiddenState& states);

    // Makes the staged rows part of the history.
    void commit();

    // stage() then commit().
    void append(const HiddenState& states);

    // Committed and staged rows of every batch row, without copying. Invalidated
    // by the next stage(), append() or reserve().
    StateViews view() const;

    // (batch, steps, H) copy of everything committed so far.
    HiddenState history() const;

private:
    std::vector<Eigen::MatrixXf> _buffers;
    int _batch = 0;
    int _hidden_dim = 0;
    int _steps = 0;
    int _staged = 0;
    int _capacity_hint = 0;
};

// Everything DecoderStack::decode_step needs to resume generation, created empty
// and extended by one step per call. Never share one across independent requests.
class CacheStack {
public:
    CacheStack() = default;
    explicit CacheStack(int num_layers, int reserve_steps = 0);

    int num_layers() const { return static_cast<int>(_layers.size()); }

    // Steps cached so far. Every layer holds exactly this many between calls.
    // A moved-from CacheStack has no layers and no steps.
    int steps() const { return _inputs.steps(); }
    bool empty() const { return steps() == 0; }

    // Post-layer outputs of decoder layer `layer`.
    const LayerCache& layer(int layer) const { return _layers.at(layer); }

    // Inputs of the first layer, i.e. the embedded target tokens seen so far.
    const LayerCache& inputs() const { return _inputs; }

    // One flag per cached step and batch row: true where that step was padding.
    const PaddingMask& padding() const { return _padding; }

private:
    friend class DecoderStack;

    std::vector<LayerCache> _layers;
    LayerCache _inputs;
    PaddingMask _padding;
};
