#pragma once
#include "decoder_stack.hpp"
#include "embeddings.hpp"
#include "encoder.hpp"
#include "output_projection.hpp"
#include "utils/model_weights.hpp"

#include <random>
#include <vector>

struct EncodedSource {
    HiddenState memory;
    PaddingMask padding_mask;
};

// Encoder/decoder text generator: encode once, then decode greedily one token per step.
class Generator {
public:
    explicit Generator(const ModelWeights& model);

    // Pads the ragged source batch and runs the encoder.
    EncodedSource encode(const TokenBatch& src) const;

    // Teacher-forced logits, one [T, vocab_size] matrix per batch row. tgt is padded
    // with pad_id and every pad_id in tgt is masked, wherever it occurs, so pad_id must
    // not appear as a real token. Dropout runs only when dropout_rng is given.
    std::vector<Eigen::MatrixXf> forward(const TokenBatch& src, const TokenBatch& tgt,
                                         std::mt19937* dropout_rng = nullptr) const;

    // Greedy decoding through DecoderStack::decode_step. Every output row starts with
    // bos_id and holds max_len tokens; rows that emitted eos_id are padded with pad_id.
    // pad_id is never chosen for an unfinished row, so outputs can be scored by forward().
    // max_len <= 0 uses config().max_len.
    TokenBatch generate(const TokenBatch& src, int max_len = 0) const;

    // Same greedy search, re-running decode_full over the whole prefix at every step.
    // Quadratic; kept as the reference the cached path is checked and timed against.
    TokenBatch generate_without_cache(const TokenBatch& src, int max_len = 0) const;

    const DecoderStack& decoder() const { return _decoder; }
    const GeneratorConfig& config() const { return _model.config(); }

private:
    const HiddenState* memory_of(const EncodedSource& source) const;
    const PaddingMask* memory_mask_of(const EncodedSource& source) const;
    int resolve_max_len(int max_len) const;

    const ModelWeights& _model;
    Embeddings _src_emb;
    Embeddings _tgt_emb;
    Encoder _encoder;
    DecoderStack _decoder;
    OutputProjection _out;
};
