#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "codalign/collaborators.hpp"
#include "codalign/core.hpp"
#include "codalign/errors.hpp"
#include "codalign/progress.hpp"
#include "codalign/sample_filter.hpp"

namespace codalign {

/// Durable unit of the corpus.
struct CachedDatapoint {
    HTensor tokens{};       ///< Int16 [tokens]
    HTensor speech_codes{}; ///< Int16 [frames, codebook depth]
    HTensor waveform{};     ///< Float32 [samples] at the canonical rate, empty when not cached
    std::string path{};
};

inline bool operator==(const CachedDatapoint& a, const CachedDatapoint& b) {
    return a.tokens == b.tokens && a.speech_codes == b.speech_codes && a.waveform == b.waveform &&
           a.path == b.path;
}

/**
 * @brief Ordered collection of datapoints and their speaker embeddings.
 *
 * `speaker_embeddings[i]` always belongs to `datapoints[i]`.
 */
struct Corpus {
    std::vector<CachedDatapoint> datapoints{};
    std::vector<HTensor> speaker_embeddings{}; ///< Float32 [dim] each

    std::size_t size() const { return datapoints.size(); }
    bool empty() const { return datapoints.empty(); }

    std::vector<std::string> paths() const {
        std::vector<std::string> out;
        out.reserve(datapoints.size());
        for (const auto& dp : datapoints)
            out.push_back(dp.path);
        return out;
    }
};

inline bool operator==(const Corpus& a, const Corpus& b) {
    return a.datapoints == b.datapoints && a.speaker_embeddings == b.speaker_embeddings;
}

/// Convert one worker result into tensors.
inline CachedDatapoint to_cached(RawDatapoint&& raw) {
    CachedDatapoint dp;
    dp.tokens = make_tensor(raw.tokens);
    const auto& codes = raw.speech_codes;
    if (codes.codes.size() != codes.frames * codes.depth)
        throw CodecError("code matrix of " + raw.path + " does not match its " +
                         std::to_string(codes.frames) + "x" + std::to_string(codes.depth) +
                         " shape");
    dp.speech_codes = make_tensor(codes.codes, {codes.frames, codes.depth});
    dp.waveform = make_tensor(raw.waveform);
    dp.path = std::move(raw.path);
    return dp;
}

/**
 * Turn the pooled worker results into a corpus.
 *
 * The pooled list keeps its order. After conversion a second pass computes
 * one speaker embedding per datapoint from its canonical-rate waveform, in
 * list order, with the single @p embedder instance. Throws EmptyCorpusError
 * when nothing survived filtering.
 */
inline Corpus assemble_corpus(std::vector<RawDatapoint> pooled, SpeakerEmbedder& embedder,
                              const ProgressFn& progress = {}) {
    if (pooled.empty())
        throw EmptyCorpusError();

    Corpus corpus;
    corpus.datapoints.reserve(pooled.size());
    for (auto& raw : pooled)
        corpus.datapoints.push_back(to_cached(std::move(raw)));
    pooled.clear();

    corpus.speaker_embeddings.reserve(corpus.size());
    for (std::size_t i = 0; i < corpus.size(); ++i) {
        auto wave = tensor_values<float>(corpus.datapoints[i].waveform);
        corpus.speaker_embeddings.push_back(make_tensor(embedder.embed(wave)));
        if (progress)
            progress("speaker embeddings", i + 1, corpus.size());
    }
    return corpus;
}

} // namespace codalign
