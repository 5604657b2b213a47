#include "generator.hpp"

#include <algorithm>
#include <stdexcept>

Generator::Generator(const ModelWeights& model)
    : _model(model),
      _src_emb(model.src_embedding(), model.config()),
      _tgt_emb(model.tgt_embedding(), model.config()),
      _encoder(model),
      _decoder(model),
      _out(model.output_projection()) {}

EncodedSource Generator::encode(const TokenBatch& src) const {
    if (src.empty()) {
        throw std::runtime_error("Cannot encode an empty source batch");
    }
    const TokenBatch padded = _src_emb.pad_batch(src);

    EncodedSource source;
    source.padding_mask = _src_emb.padding_mask(padded);
    source.memory = _encoder.forward(_src_emb.encode(padded), &source.padding_mask);
    return source;
}

// Decoder-only models never hand memory to the decoder.
const HiddenState* Generator::memory_of(const EncodedSource& source) const {
    return config().use_cross_attention ? &source.memory : nullptr;
}

const PaddingMask* Generator::memory_mask_of(const EncodedSource& source) const {
    return config().use_cross_attention ? &source.padding_mask : nullptr;
}

int Generator::resolve_max_len(int max_len) const {
    const int resolved = max_len > 0 ? max_len : config().max_len;
    if (resolved < 2) {
        throw std::runtime_error("max_len must leave room for at least one generated token");
    }
    return resolved;
}

std::vector<Eigen::MatrixXf> Generator::forward(const TokenBatch& src, const TokenBatch& tgt,
                                                std::mt19937* dropout_rng) const {
    if (src.size() != tgt.size()) {
        throw std::runtime_error("Source batch has " + std::to_string(src.size()) + " rows, target batch has " +
                                 std::to_string(tgt.size()));
    }
    const EncodedSource source = encode(src);

    const TokenBatch padded = _tgt_emb.pad_batch(tgt);
    const PaddingMask tgt_mask = _tgt_emb.padding_mask(padded);

    HiddenState dec_out = _decoder.decode_full(_tgt_emb.encode(padded), memory_of(source),
                                               &tgt_mask, memory_mask_of(source), dropout_rng);
    return _out.forward(dec_out);
}

TokenBatch Generator::generate(const TokenBatch& src, int max_len) const {
    const int len = resolve_max_len(max_len);
    const EncodedSource source = encode(src);
    const int batch = source.memory.batch();

    TokenBatch pred(batch, std::vector<int>{config().bos_id});
    std::vector<bool> finished(batch, false);
    std::optional<CacheStack> cache;

    for (int idx = 1; idx < len; ++idx) {
        // Feed the newest token of every row at its absolute position; finished rows
        // advance in lockstep with a padding token the others never attend to.
        TokenBatch step(batch);
        PaddingMask step_mask(batch);
        for (int b = 0; b < batch; ++b) {
            step[b] = {finished[b] ? config().pad_id : pred[b].back()};
            step_mask[b] = {finished[b]};
        }

        StepResult result = _decoder.decode_step(_tgt_emb.encode(step, idx - 1), memory_of(source),
                                                 std::move(cache), &step_mask, memory_mask_of(source));
        cache = std::move(result.cache);

        const std::vector<int> next = _out.argmax_last(result.output, config().pad_id);
        for (int b = 0; b < batch; ++b) {
            pred[b].push_back(finished[b] ? config().pad_id : next[b]);
            if (next[b] == config().eos_id) finished[b] = true;
        }

        if (std::all_of(finished.begin(), finished.end(), [](bool f) { return f; })) break;
    }

    for (auto& row : pred) row.resize(len, config().pad_id);
    return pred;
}

TokenBatch Generator::generate_without_cache(const TokenBatch& src, int max_len) const {
    const int len = resolve_max_len(max_len);
    const EncodedSource source = encode(src);
    const int batch = source.memory.batch();

    TokenBatch pred(batch, std::vector<int>{config().bos_id});
    // Mirrors the padding generate() feeds after a row finished.
    TokenBatch fed = pred;
    PaddingMask fed_mask(batch, std::vector<bool>{false});
    std::vector<bool> finished(batch, false);

    for (int idx = 1; idx < len; ++idx) {
        HiddenState dec_out = _decoder.decode_full(_tgt_emb.encode(fed), memory_of(source),
                                                   &fed_mask, memory_mask_of(source));

        const std::vector<int> next = _out.argmax_last(dec_out, config().pad_id);
        for (int b = 0; b < batch; ++b) {
            pred[b].push_back(finished[b] ? config().pad_id : next[b]);
            if (next[b] == config().eos_id) finished[b] = true;

            fed[b].push_back(finished[b] ? config().pad_id : pred[b].back());
            fed_mask[b].push_back(finished[b]);
        }

        if (std::all_of(finished.begin(), finished.end(), [](bool f) { return f; })) break;
    }

    for (auto& row : pred) row.resize(len, config().pad_id);
    return pred;
}
