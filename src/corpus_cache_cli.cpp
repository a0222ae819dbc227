#include <iostream>
#include <string>

#include <codalign/cache_store.hpp>
#include <codalign/errors.hpp>
#include <codalign/version.hpp>

// ---------------------------------------------------------------------------
// Corpus cache CLI
// ---------------------------------------------------------------------------
// Inspects a cache directory produced by AlignerDataset without needing any
// of the models used to build it. Every command takes the cache directory,
// not the blob file, so the same path given to the dataset works here.
// ---------------------------------------------------------------------------

using namespace codalign;

namespace {

void usage() {
    std::cerr << "Usage:\n"
              << "  corpus_cache_cli info <cache_dir>\n"
              << "  corpus_cache_cli paths <cache_dir>\n"
              << "  corpus_cache_cli hash <cache_dir>\n"
              << "  corpus_cache_cli verify <cache_dir>\n"
              << "  corpus_cache_cli --version\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc == 2 && std::string(argv[1]) == "--version") {
        std::cout << "corpus_cache_cli " << CODALIGN_VERSION_MAJOR << '.' << CODALIGN_VERSION_MINOR
                  << '.' << CODALIGN_VERSION_PATCH << " (cache format " << cache_format_version()
                  << ")" << std::endl;
        return 0;
    }
    if (argc < 3) {
        usage();
        return 1;
    }
    std::string cmd = argv[1];
    CacheStore store(argv[2]);

    try {
        if (cmd == "info") {
            CacheInfo info = store.inspect();
            std::cout << "datapoints: " << info.count << '\n'
                      << "format version: " << info.format_version << '\n'
                      << "compressed: " << (info.compressed ? "yes" : "no") << '\n'
                      << "waveforms: " << (info.has_waveforms ? "yes" : "no") << '\n'
                      << "embedding dim: " << info.embedding_dim << '\n'
                      << "bytes: " << info.file_bytes << std::endl;
            return 0;
        }
        if (cmd == "paths") {
            // Surviving source files in index order.
            for (const auto& p : store.load().paths())
                std::cout << p << '\n';
            std::cout.flush();
            return 0;
        }
        if (cmd == "hash") {
            std::cout << store.file_digest() << std::endl;
            return 0;
        }
        if (cmd == "verify") {
            auto corpus = store.load();
            std::cout << "ok: " << corpus.size() << " datapoints" << std::endl;
            return 0;
        }
    } catch (const CacheError& e) {
        std::cerr << "invalid cache: " << e.what() << '\n';
        return 2;
    } catch (const std::exception& e) {
        std::cerr << e.what() << '\n';
        return 1;
    }

    usage();
    return 1;
}
