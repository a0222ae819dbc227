#pragma once

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "codalign/sample_filter.hpp"

namespace codalign {

/**
 * Split @p keys into @p parts contiguous slices.
 *
 * The slices cover the list in order without gaps or overlaps and their
 * sizes differ by at most one. Leading slices take the remainder. When there
 * are fewer keys than parts the trailing slices are empty.
 */
inline std::vector<std::vector<std::string>> partition_keys(const std::vector<std::string>& keys,
                                                            std::size_t parts) {
    if (parts == 0)
        throw std::invalid_argument("worker count must be at least one");
    std::vector<std::vector<std::string>> out(parts);
    std::size_t base = keys.size() / parts;
    std::size_t extra = keys.size() % parts;
    std::size_t start = 0;
    for (std::size_t p = 0; p < parts; ++p) {
        std::size_t count = base + (p < extra ? 1 : 0);
        out[p].assign(keys.begin() + start, keys.begin() + start + count);
        start += count;
    }
    return out;
}

/**
 * @brief Append-only collection of per-worker result chunks.
 *
 * Every worker appends exactly once, when its partition is done. The only
 * synchronisation is one lock around the append.
 */
class ResultPool {
  public:
    void append(std::size_t worker, std::vector<RawDatapoint> chunk) {
        std::lock_guard<std::mutex> lock(mutex_);
        chunks_.emplace_back(worker, std::move(chunk));
    }

    std::size_t chunk_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return chunks_.size();
    }

    /// Flatten all chunks in worker order, leaving the pool empty.
    std::vector<RawDatapoint> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::stable_sort(chunks_.begin(), chunks_.end(),
                         [](const auto& a, const auto& b) { return a.first < b.first; });
        std::size_t total = 0;
        for (const auto& c : chunks_)
            total += c.second.size();
        std::vector<RawDatapoint> flat;
        flat.reserve(total);
        for (auto& c : chunks_)
            for (auto& dp : c.second)
                flat.push_back(std::move(dp));
        chunks_.clear();
        return flat;
    }

  private:
    mutable std::mutex mutex_{};
    std::vector<std::pair<std::size_t, std::vector<RawDatapoint>>> chunks_{};
};

/**
 * Run one SampleFilter per partition concurrently and block until all finish.
 *
 * Each worker builds its own models through @p collaborators. A worker that
 * throws loses its partition: the failure is printed and recorded in its
 * report while the others carry on. Returns one report per partition.
 */
inline std::vector<WorkerReport> run_workers(const std::vector<std::string>& shuffled_keys,
                                             std::size_t worker_count,
                                             const PathToTranscriptMap& transcripts,
                                             const FilterOptions& options,
                                             const Collaborators& collaborators, ResultPool& pool,
                                             const ProgressFn& progress = {}) {
    auto splits = partition_keys(shuffled_keys, worker_count);
    std::vector<WorkerReport> reports(splits.size());
    std::vector<std::thread> threads;
    threads.reserve(splits.size());
    for (std::size_t w = 0; w < splits.size(); ++w) {
        reports[w].worker = w;
        threads.emplace_back([&, w]() {
            try {
                SampleFilter filter(transcripts, options, collaborators);
                auto chunk = filter.run(splits[w], reports[w], progress);
                pool.append(w, std::move(chunk));
            } catch (const std::exception& e) {
                reports[w].failure = e.what();
                std::cerr << "worker " << w << " aborted: " << e.what() << '\n';
            } catch (...) {
                reports[w].failure = "unknown failure";
                std::cerr << "worker " << w << " aborted: unknown failure\n";
            }
        });
    }
    for (auto& t : threads)
        t.join();
    return reports;
}

} // namespace codalign
