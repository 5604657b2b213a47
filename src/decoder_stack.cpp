#include "decoder_stack.hpp"

#include <sstream>
#include <utility>
#include <stdexcept>

DecoderStack::DecoderStack(const ModelWeights& model) : _config(model.config()) {
    _layers.reserve(model.decoder_layers().size());
    for (const auto& weights : model.decoder_layers()) {
        _layers.emplace_back(weights, _config);
    }
}

HiddenState DecoderStack::decode_full(const HiddenState& tgt,
                                      const HiddenState* memory,
                                      const PaddingMask* tgt_padding_mask,
                                      const PaddingMask* memory_padding_mask,
                                      std::mt19937* dropout_rng) const {
    HiddenState output = tgt;
    for (const auto& layer : _layers) {
        output = layer.forward(output, memory, DecodeMode::Full,
                               tgt_padding_mask, memory_padding_mask, dropout_rng);
    }
    return output;
}

void DecoderStack::check_step(const HiddenState& new_tokens, const CacheStack& cache,
                              const PaddingMask* new_token_padding_mask) const {
    new_tokens.assert_shape(-1, -1, _config.hidden_dim, "new_tokens");
    if (new_tokens.empty() || new_tokens.seq_len() == 0) {
        throw std::runtime_error("decode_step needs at least one new position");
    }
    if (cache.num_layers() == 0) {
        throw std::runtime_error("CacheStack has no layers; it was default-constructed or moved from");
    }
    if (cache.num_layers() != num_layers()) {
        std::ostringstream oss;
        oss << "CacheStack has " << cache.num_layers() << " layers, decoder has " << num_layers();
        throw std::runtime_error(oss.str());
    }
    if (new_token_padding_mask != nullptr) {
        tensor_utils::assert_mask_shape(*new_token_padding_mask, new_tokens.batch(), new_tokens.seq_len(),
                                        "new_token_padding_mask");
    }
    if (cache.empty()) return;

    if (new_tokens.seq_len() != 1) {
        std::ostringstream oss;
        oss << "decode_step got " << new_tokens.seq_len() << " new positions for a non-empty cache of "
            << cache.steps() << " steps; exactly one is allowed";
        throw std::runtime_error(oss.str());
    }
    if (new_tokens.batch() != cache.inputs().batch()) {
        std::ostringstream oss;
        oss << "decode_step got batch " << new_tokens.batch() << " for a cache of batch " << cache.inputs().batch();
        throw std::runtime_error(oss.str());
    }
}

StepResult DecoderStack::decode_step(const HiddenState& new_tokens,
                                     const HiddenState* memory,
                                     std::optional<CacheStack>&& cache,
                                     const PaddingMask* new_token_padding_mask,
                                     const PaddingMask* memory_padding_mask) const {
    if (!cache.has_value()) {
        return decode_step(new_tokens, memory, CacheStack(num_layers(), _config.max_len),
                           new_token_padding_mask, memory_padding_mask);
    }
    return decode_step(new_tokens, memory, std::move(*cache), new_token_padding_mask, memory_padding_mask);
}

StepResult DecoderStack::decode_step(const HiddenState& new_tokens,
                                     const HiddenState* memory,
                                     CacheStack&& cache,
                                     const PaddingMask* new_token_padding_mask,
                                     const PaddingMask* memory_padding_mask) const {
    check_step(new_tokens, cache, new_token_padding_mask);

    if (memory != nullptr) {
        memory->assert_shape(new_tokens.batch(), -1, _config.hidden_dim, "memory");
    }

    // An empty cache is prefilled: the whole prefix goes through each layer under a
    // causal mask and every position is cached. A one-token prefix is just a step.
    const bool prefill = cache.empty() && new_tokens.seq_len() > 1;
    const DecodeMode mode = prefill ? DecodeMode::Full : DecodeMode::Incremental;

    // Padding history including the new positions; shared by every layer.
    PaddingMask padding = cache._padding;
    if (padding.empty()) padding.assign(new_tokens.batch(), {});
    for (int b = 0; b < new_tokens.batch(); ++b) {
        for (int t = 0; t < new_tokens.seq_len(); ++t) {
            padding[b].push_back(new_token_padding_mask != nullptr && (*new_token_padding_mask)[b][t]);
        }
    }

    // New positions are staged right behind each layer's history, and the next layer
    // reads history plus staged rows in place as its key/value context. Layer 0's
    // context is the input history.
    cache._inputs.stage(new_tokens);
    HiddenState output;
    for (size_t idx = 0; idx < _layers.size(); ++idx) {
        const LayerCache& context = idx == 0 ? cache._inputs : cache._layers[idx - 1];
        output = _layers[idx].forward(context.view(), memory, mode, &padding, memory_padding_mask);
        cache._layers[idx].stage(output);
    }

    // Every layer succeeded; only now does the cache advance, so a failure above leaves
    // no layer one step ahead of another.
    cache._inputs.commit();
    for (auto& layer : cache._layers) layer.commit();
    cache._padding = std::move(padding);

    return StepResult{output.last_position(), std::move(cache)};
}
