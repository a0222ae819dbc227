#include <atomic>
#include <cstdlib>
#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <codalign/config.hpp>
#include <codalign/corpus.hpp>
#include <codalign/progress.hpp>
#include <codalign/shuffle.hpp>
#include <codalign/worker_pool.hpp>

#include "fake_models.hpp"

using namespace codalign;
using namespace codalign_test;

namespace {

RawDatapoint raw(const std::string& path, std::size_t samples, std::size_t frames) {
    RawDatapoint dp;
    dp.path = path;
    dp.tokens = {1, 2, 3};
    dp.speech_codes.frames = frames;
    dp.speech_codes.depth = 2;
    dp.speech_codes.codes.assign(frames * 2, 7);
    dp.waveform.assign(samples, 0.5f);
    return dp;
}

} // namespace

TEST(CorpusTest, EmbeddingsFollowDatapoints) {
    std::vector<RawDatapoint> pooled;
    pooled.push_back(raw("a.wav", 100, 3));
    pooled.push_back(raw("b.wav", 250, 5));
    pooled.push_back(raw("c.wav", 40, 1));
    FakeEmbedder embedder(nullptr);
    std::size_t last_done = 0;
    auto corpus = assemble_corpus(std::move(pooled), embedder,
                                  [&](const std::string& stage, std::size_t done, std::size_t) {
                                      EXPECT_EQ(stage, "speaker embeddings");
                                      last_done = done;
                                  });

    ASSERT_EQ(corpus.size(), 3u);
    ASSERT_EQ(corpus.speaker_embeddings.size(), 3u);
    EXPECT_EQ(last_done, 3u);
    EXPECT_EQ(corpus.paths(), (std::vector<std::string>{"a.wav", "b.wav", "c.wav"}));
    for (std::size_t i = 0; i < corpus.size(); ++i) {
        auto emb = tensor_values<float>(corpus.speaker_embeddings[i]);
        EXPECT_EQ(static_cast<std::size_t>(emb[0]), corpus.datapoints[i].waveform.numel());
    }

    const auto& codes = corpus.datapoints[1].speech_codes;
    EXPECT_EQ(codes.dtype(), HTensor::DType::Int16);
    EXPECT_EQ(codes.shape(), (HTensor::Shape{5, 2}));
    EXPECT_EQ(corpus.datapoints[1].tokens.dtype(), HTensor::DType::Int16);
    EXPECT_EQ(corpus.datapoints[1].waveform.dtype(), HTensor::DType::Float32);
}

TEST(CorpusTest, EmptyPoolIsFatal) {
    FakeEmbedder embedder(nullptr);
    EXPECT_THROW(assemble_corpus({}, embedder), EmptyCorpusError);
}

TEST(CorpusTest, InconsistentCodeMatrixRejected) {
    auto dp = raw("bad.wav", 10, 2);
    dp.speech_codes.codes.pop_back();
    EXPECT_THROW(to_cached(std::move(dp)), CodecError);
}

TEST(WorkerPoolTest, MergesPartitionsInWorkerOrder) {
    auto dir = scratch_dir("workers_merge");
    PathToTranscriptMap transcripts;
    std::vector<std::string> keys;
    for (int i = 0; i < 9; ++i) {
        auto path = write_tone(dir, "clip" + std::to_string(i) + ".wav", 1.0 + 0.1 * i, 16000);
        transcripts[path] = "clip";
        keys.push_back(path);
    }
    auto rng = make_shuffle_rng(5);
    fisher_yates_shuffle(keys, rng);

    auto calls = std::make_shared<FactoryCalls>();
    auto collab = fake_collaborators(calls);
    ResultPool pool;
    auto reports = run_workers(keys, 4, transcripts, FilterOptions{}, collab, pool);

    ASSERT_EQ(reports.size(), 4u);
    std::size_t kept = 0;
    for (std::size_t w = 0; w < reports.size(); ++w) {
        EXPECT_EQ(reports[w].worker, w);
        EXPECT_TRUE(reports[w].failure.empty());
        kept += reports[w].kept;
    }
    EXPECT_EQ(kept, 9u);
    // Every worker owns its own models.
    EXPECT_EQ(calls->frontend.load(), 4);
    EXPECT_EQ(calls->codec.load(), 4);

    auto merged = pool.drain();
    ASSERT_EQ(merged.size(), keys.size());
    for (std::size_t i = 0; i < keys.size(); ++i)
        EXPECT_EQ(merged[i].path, keys[i]);
}

TEST(WorkerPoolTest, FailedPartitionDoesNotStopOthers) {
    auto dir = scratch_dir("workers_failure");
    PathToTranscriptMap transcripts;
    auto missing = (dir / "missing.wav").string();
    transcripts[missing] = "gone";
    auto a = write_tone(dir, "a.wav", 2.0, 16000);
    auto b = write_tone(dir, "b.wav", 2.0, 16000);
    transcripts[a] = "a";
    transcripts[b] = "b";

    auto collab = fake_collaborators(std::make_shared<FactoryCalls>());
    ResultPool pool;
    // Worker 0 gets only the missing file and cannot establish its rate.
    auto reports = run_workers({missing, a, b}, 3, transcripts, FilterOptions{}, collab, pool);

    EXPECT_FALSE(reports[0].failure.empty());
    EXPECT_TRUE(reports[1].failure.empty());
    EXPECT_TRUE(reports[2].failure.empty());
    auto merged = pool.drain();
    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0].path, a);
    EXPECT_EQ(merged[1].path, b);
}

TEST(WorkerPoolTest, NonStandardExceptionIsRecorded) {
    auto dir = scratch_dir("workers_unknown_failure");
    PathToTranscriptMap transcripts;
    auto a = write_tone(dir, "a.wav", 2.0, 16000);
    auto b = write_tone(dir, "b.wav", 2.0, 16000);
    transcripts[a] = "a";
    transcripts[b] = "b";

    auto collab = fake_collaborators(std::make_shared<FactoryCalls>());
    auto make_frontend = collab.make_frontend;
    auto created = std::make_shared<std::atomic<int>>(0);
    collab.make_frontend = [make_frontend, created](const std::string& lang) {
        if (created->fetch_add(1) == 0)
            throw 42;
        return make_frontend(lang);
    };
    ResultPool pool;
    auto reports = run_workers({a, b}, 2, transcripts, FilterOptions{}, collab, pool);

    std::size_t unknown = 0;
    for (const auto& r : reports)
        if (r.failure == "unknown failure")
            ++unknown;
    EXPECT_EQ(unknown, 1u);
    EXPECT_EQ(pool.drain().size(), 1u);
}

TEST(ProgressTest, RewritesOneLinePerStage) {
    std::ostringstream out;
    auto progress = make_text_progress(out, 2);
    for (std::size_t i = 1; i <= 3; ++i)
        progress("worker 0", i, 3);
    progress("speaker embeddings", 1, 1);
    EXPECT_EQ(out.str(), "\rworker 0: 2/3\rworker 0: 3/3\n\rspeaker embeddings: 1/1\n");
}

#ifdef __unix__
TEST(ConfigTest, EnvironmentOverrides) {
    setenv("CODALIGN_LOADING_PROCESSES", "6", 1);
    EXPECT_EQ(default_loading_processes(), 6u);
    setenv("CODALIGN_LOADING_PROCESSES", "zero", 1);
    EXPECT_GE(default_loading_processes(), 1u);
    unsetenv("CODALIGN_LOADING_PROCESSES");

    setenv("CODALIGN_CACHE_COMPRESS", "1", 1);
    EXPECT_TRUE(default_cache_compression());
    setenv("CODALIGN_CACHE_COMPRESS", "0", 1);
    EXPECT_FALSE(default_cache_compression());
    unsetenv("CODALIGN_CACHE_COMPRESS");
    EXPECT_EQ(canonical_sample_rate(), 16000);
}
#endif

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
