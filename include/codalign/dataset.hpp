#pragma once

/// \file dataset.hpp
/// \brief Random-access aligner training corpus backed by an on-disk cache.
///
/// Constructing an AlignerDataset either reloads an existing cache or runs
/// the full build: audit list, shuffle, parallel filtering, pooling, speaker
/// embeddings and save. Afterwards the dataset serves indexed samples and
/// decodes speech codes into continuous features on access.

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "codalign/cache_store.hpp"
#include "codalign/collaborators.hpp"
#include "codalign/config.hpp"
#include "codalign/corpus.hpp"
#include "codalign/errors.hpp"
#include "codalign/progress.hpp"
#include "codalign/sample_filter.hpp"
#include "codalign/shuffle.hpp"
#include "codalign/worker_pool.hpp"

namespace codalign {

/**
 * @brief Transcript map given either directly or through a factory.
 *
 * The factory is invoked at most once and only when a build is needed, so an
 * expensive transcript scan is skipped whenever the cache can be reused.
 */
class TranscriptSource {
  public:
    using Factory = std::function<PathToTranscriptMap()>;

    TranscriptSource(PathToTranscriptMap map) : map_{std::move(map)}, resolved_{true} {}
    TranscriptSource(Factory factory) : factory_{std::move(factory)} {}

    bool resolved() const { return resolved_; }

    const PathToTranscriptMap& resolve() {
        if (!resolved_) {
            if (!factory_)
                throw std::invalid_argument("transcript factory is empty");
            map_ = factory_();
            resolved_ = true;
        }
        return map_;
    }

  private:
    PathToTranscriptMap map_{};
    Factory factory_{};
    bool resolved_{false};
};

/// Everything that controls how a corpus is built.
struct CorpusOptions {
    std::string lang{"eng"};
    std::size_t loading_processes{default_loading_processes()};
    std::string device{"cpu"};
    double min_len_seconds{1.0};
    double max_len_seconds{15.0};
    bool rebuild_cache{false};
    bool verbose{false};
    bool phone_input{false};
    bool allow_unknown_symbols{false};
    /// Shuffle seed, 0 draws one from std::random_device.
    std::uint64_t seed{0};
    /// 0 takes the rate of the first file of every partition.
    int expected_sample_rate{0};
    bool compress_cache{default_cache_compression()};
    bool cache_waveforms{false};
    ProgressFn progress{};
};

/// One training sample as handed to the training loop.
struct AlignerSample {
    HTensor tokens{};            ///< Int64 [T]
    HTensor token_length{};      ///< Int64 [1]
    HTensor speech{};            ///< Float32 [frames, dim]
    HTensor speech_length{};     ///< Int64 [1]
    HTensor speaker_embedding{}; ///< Float32 [dim]
};

class AlignerDataset {
  public:
    /**
     * Load the corpus from @p cache_dir or build it.
     *
     * A build happens when the cache blob is missing or
     * CorpusOptions::rebuild_cache is set. A blob that exists but cannot be
     * read raises CacheError; it is never rebuilt silently.
     */
    AlignerDataset(TranscriptSource transcripts, std::filesystem::path cache_dir,
                   CorpusOptions options, Collaborators collaborators)
        : store_{std::move(cache_dir)}, options_{std::move(options)},
          collab_{std::move(collaborators)} {
        if (!collab_.make_codec)
            throw std::invalid_argument("a codec factory is required");
        if (!store_.exists() || options_.rebuild_cache)
            build(transcripts);
        else
            corpus_ = store_.load();
        std::cout << "Prepared an Aligner dataset with " << corpus_.size() << " datapoints in "
                  << store_.dir().string() << "." << std::endl;
    }

    AlignerDataset(const AlignerDataset&) = delete;
    AlignerDataset& operator=(const AlignerDataset&) = delete;

    std::size_t size() const { return corpus_.size(); }
    const Corpus& corpus() const { return corpus_; }
    const CacheStore& store() const { return store_; }

    /// Worker reports of the build, empty when the corpus came from the cache.
    const std::vector<WorkerReport>& reports() const { return reports_; }

    /**
     * Fetch sample @p index with its speech codes decoded.
     *
     * Each calling thread gets its own decoder, created on that thread's
     * first call and kept for the life of this dataset, so concurrent readers
     * decode in parallel. Decoder errors propagate unchanged.
     */
    AlignerSample get(std::size_t index) {
        if (index >= corpus_.size())
            throw std::out_of_range("index " + std::to_string(index) + " out of range for " +
                                    std::to_string(corpus_.size()) + " datapoints");
        const auto& dp = corpus_.datapoints[index];

        AlignerSample s;
        auto ids = tensor_values<std::int16_t>(dp.tokens);
        s.tokens = make_tensor(std::vector<std::int64_t>(ids.begin(), ids.end()));
        s.token_length = make_tensor(std::vector<std::int64_t>{static_cast<std::int64_t>(ids.size())});
        std::int64_t frames = dp.speech_codes.shape().empty()
                                  ? 0
                                  : static_cast<std::int64_t>(dp.speech_codes.shape()[0]);
        s.speech_length = make_tensor(std::vector<std::int64_t>{frames});
        s.speech = thread_decoder().decode(dp.speech_codes);
        s.speaker_embedding = corpus_.speaker_embeddings[index];
        return s;
    }

    /// Number of decoders created so far, one per thread that called get().
    std::size_t decoder_count() const {
        std::lock_guard<std::mutex> lock(decoder_mutex_);
        return decoders_.size();
    }

  private:
    CacheStore store_;
    CorpusOptions options_{};
    Collaborators collab_{};
    Corpus corpus_{};
    std::vector<WorkerReport> reports_{};
    std::unordered_map<std::thread::id, std::unique_ptr<CodecModel>> decoders_{};
    mutable std::mutex decoder_mutex_{};

    /// The lock only guards the map; decoding happens outside it.
    CodecModel& thread_decoder() {
        std::lock_guard<std::mutex> lock(decoder_mutex_);
        auto id = std::this_thread::get_id();
        auto it = decoders_.find(id);
        if (it != decoders_.end())
            return *it->second;
        auto decoder = collab_.make_codec(kDecodeOnly, "cpu");
        if (!decoder)
            throw CodecError("codec factory returned no decoder");
        return *decoders_.emplace(id, std::move(decoder)).first->second;
    }

    FilterOptions filter_options() const {
        FilterOptions f;
        f.lang = options_.lang;
        f.device = options_.device;
        f.min_len_seconds = options_.min_len_seconds;
        f.max_len_seconds = options_.max_len_seconds;
        f.verbose = options_.verbose;
        f.phone_input = options_.phone_input;
        f.allow_unknown_symbols = options_.allow_unknown_symbols;
        f.expected_sample_rate = options_.expected_sample_rate;
        return f;
    }

    void build(TranscriptSource& source) {
        if (!collab_.make_frontend || !collab_.make_embedder)
            throw std::invalid_argument("building a corpus needs frontend and embedder factories");
        const PathToTranscriptMap& transcripts = source.resolve();

        std::vector<std::string> keys;
        keys.reserve(transcripts.size());
        for (const auto& kv : transcripts)
            keys.push_back(kv.first);
        store_.write_audit(keys);

        auto rng = make_shuffle_rng(options_.seed);
        fisher_yates_shuffle(keys, rng);

        std::cout << "... building dataset cache ..." << std::endl;
        std::size_t workers = options_.loading_processes > 0 ? options_.loading_processes : 1;
        ResultPool pool;
        reports_ = run_workers(keys, workers, transcripts, filter_options(), collab_, pool,
                               options_.progress);
        if (options_.verbose) {
            for (const auto& r : reports_) {
                std::cout << "worker " << r.worker << ": " << r.kept << " of " << r.assigned
                          << " kept";
                for (std::size_t i = 0; i < kSkipReasonCount; ++i)
                    if (r.skipped[i] > 0)
                        std::cout << ", " << r.skipped[i] << " "
                                  << skip_reason_name(static_cast<SkipReason>(i));
                if (!r.failure.empty())
                    std::cout << ", aborted: " << r.failure;
                std::cout << '\n';
            }
        }

        std::cout << "pooling results..." << std::endl;
        auto pooled = pool.drain();
        if (pooled.empty())
            throw EmptyCorpusError();
        auto embedder = collab_.make_embedder(options_.device);
        if (!embedder)
            throw std::runtime_error("speaker embedder factory returned no instance");
        corpus_ = assemble_corpus(std::move(pooled), *embedder, options_.progress);
        store_.save(corpus_, options_.compress_cache, options_.cache_waveforms);
    }
};

} // namespace codalign
