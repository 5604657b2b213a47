#pragma once
#include "decoder_layer.hpp"
#include "layer_cache.hpp"
#include "utils/model_weights.hpp"

#include <optional>
#include <random>
#include <vector>

struct StepResult {
    HiddenState output;  // (batch, 1, H): final layer state of the newest position
    CacheStack cache;    // every entry one step longer than the one passed in
};

// Runs the decoder layers in order. Two entry points:
//
//   decode_full  - teacher-forced: every layer sees the whole target sequence under a
//                  causal mask. No cache is created or consulted.
//   decode_step  - generation: one new token per call, with a CacheStack carrying the
//                  per-layer history so earlier positions are never recomputed.
//
// For any prefix, the outputs of successive decode_step calls match the rows of
// decode_full on that prefix up to float summation order.
class DecoderStack {
public:
    explicit DecoderStack(const ModelWeights& model);

    HiddenState decode_full(const HiddenState& tgt,
                            const HiddenState* memory,
                            const PaddingMask* tgt_padding_mask = nullptr,
                            const PaddingMask* memory_padding_mask = nullptr,
                            std::mt19937* dropout_rng = nullptr) const;

    // Pass std::nullopt (or a fresh CacheStack(num_layers())) on the first call. The
    // first call may carry a whole prefix, which is prefilled under a causal mask; every
    // later call must carry exactly one new position per batch row.
    //
    // The cache is taken over only when the step succeeds: on a rejected or failed
    // call the caller's cache is left exactly as it was passed in. A default-constructed
    // or moved-from CacheStack has no layers and is rejected.
    //
    // new_token_padding_mask flags positions of new_tokens that are padding; the flags
    // are kept in the cache so later steps never attend to them.
    StepResult decode_step(const HiddenState& new_tokens,
                           const HiddenState* memory,
                           CacheStack&& cache,
                           const PaddingMask* new_token_padding_mask = nullptr,
                           const PaddingMask* memory_padding_mask = nullptr) const;

    StepResult decode_step(const HiddenState& new_tokens,
                           const HiddenState* memory,
                           std::optional<CacheStack>&& cache,
                           const PaddingMask* new_token_padding_mask = nullptr,
                           const PaddingMask* memory_padding_mask = nullptr) const;

    int num_layers() const { return static_cast<int>(_layers.size()); }
    const DecoderLayer& layer(int idx) const { return _layers.at(idx); }

private:
    void check_step(const HiddenState& new_tokens, const CacheStack& cache,
                    const PaddingMask* new_token_padding_mask) const;

    GeneratorConfig _config;
    std::vector<DecoderLayer> _layers;
};
