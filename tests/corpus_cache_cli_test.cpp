#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <string>
#include <vector>
#ifdef __unix__
#include <sys/wait.h>
#endif

#include <codalign/cache_store.hpp>
#include <codalign/version.hpp>

#include "fake_models.hpp"

using namespace codalign;
using codalign_test::scratch_dir;

namespace {

Corpus two_clip_corpus() {
    Corpus c;
    for (int i = 0; i < 2; ++i) {
        CachedDatapoint dp;
        dp.tokens = make_tensor(std::vector<std::int16_t>{3, 4});
        dp.speech_codes = make_tensor(std::vector<std::int16_t>{1, 2, 3, 4}, {2, 2});
        dp.waveform = make_tensor(std::vector<float>{0.f, 0.1f});
        dp.path = "/corpus/clip" + std::to_string(i) + ".wav";
        c.datapoints.push_back(dp);
        c.speaker_embeddings.push_back(make_tensor(std::vector<float>{1.f, 2.f, 3.f, 4.f}));
    }
    return c;
}

std::string slurp(const std::string& path) {
    std::ifstream in(path);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

int exit_code(int status) {
#ifdef __unix__
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
#else
    return status;
#endif
}

} // namespace

TEST(CorpusCacheCli, Paths) {
    auto dir = scratch_dir("cli_paths");
    CacheStore(dir).save(two_clip_corpus());
    auto out = (dir / "paths.txt").string();

    std::string cmd = "./corpus_cache_cli paths " + dir.string() + " > " + out;
    ASSERT_EQ(exit_code(std::system(cmd.c_str())), 0);
    EXPECT_EQ(slurp(out), "/corpus/clip0.wav\n/corpus/clip1.wav\n");
}

TEST(CorpusCacheCli, Info) {
    auto dir = scratch_dir("cli_info");
    CacheStore(dir).save(two_clip_corpus(), true, true);
    auto out = (dir / "info.txt").string();

    std::string cmd = "./corpus_cache_cli info " + dir.string() + " > " + out;
    ASSERT_EQ(exit_code(std::system(cmd.c_str())), 0);
    auto text = slurp(out);
    EXPECT_NE(text.find("datapoints: 2"), std::string::npos);
    EXPECT_NE(text.find("compressed: yes"), std::string::npos);
    EXPECT_NE(text.find("waveforms: yes"), std::string::npos);
    EXPECT_NE(text.find("embedding dim: 4"), std::string::npos);
}

TEST(CorpusCacheCli, Hash) {
    auto dir = scratch_dir("cli_hash");
    CacheStore store(dir);
    store.save(two_clip_corpus());
    auto out = (dir / "hash.txt").string();

    std::string cmd = "./corpus_cache_cli hash " + dir.string() + " > " + out;
    ASSERT_EQ(exit_code(std::system(cmd.c_str())), 0);
    EXPECT_EQ(slurp(out), store.file_digest() + "\n");
}

TEST(CorpusCacheCli, VerifyDetectsDamage) {
    auto dir = scratch_dir("cli_verify");
    CacheStore store(dir);
    store.save(two_clip_corpus());

    std::string cmd = "./corpus_cache_cli verify " + dir.string() + " > /dev/null 2>&1";
    EXPECT_EQ(exit_code(std::system(cmd.c_str())), 0);

    {
        std::fstream f(store.blob_path(), std::ios::in | std::ios::out | std::ios::binary);
        f.seekp(20);
        f.put('\x7f');
    }
    EXPECT_EQ(exit_code(std::system(cmd.c_str())), 2);

    std::filesystem::remove(store.blob_path());
    EXPECT_EQ(exit_code(std::system(cmd.c_str())), 2);
}

TEST(CorpusCacheCli, UnknownCommand) {
    auto dir = scratch_dir("cli_usage");
    std::string cmd = "./corpus_cache_cli frobnicate " + dir.string() + " 2> /dev/null";
    EXPECT_EQ(exit_code(std::system(cmd.c_str())), 1);
    EXPECT_EQ(exit_code(std::system("./corpus_cache_cli 2> /dev/null")), 1);
}

TEST(CorpusCacheCli, Version) {
    static_assert(version() == CODALIGN_VERSION_MAJOR * 10000 + CODALIGN_VERSION_MINOR * 100 +
                                   CODALIGN_VERSION_PATCH,
                  "version encoding");
    auto dir = scratch_dir("cli_version");
    auto out = (dir / "version.txt").string();
    std::string cmd = "./corpus_cache_cli --version > " + out;
    ASSERT_EQ(exit_code(std::system(cmd.c_str())), 0);
    EXPECT_NE(slurp(out).find("cache format " + std::to_string(cache_format_version())),
              std::string::npos);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
