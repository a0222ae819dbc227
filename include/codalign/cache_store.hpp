#pragma once

/// \file cache_store.hpp
/// \brief On-disk persistence of a built corpus.
///
/// A cache directory holds two files: the corpus blob and a plain text list
/// of every key that was considered for inclusion. The list is for people
/// only and is never read back.
///
/// Blob layout (little endian):
///
///     magic    "ALGN" or "ALGZ" (zstd compressed body)
///     u32      cache format version
///     u64      record count
///     body     see write_corpus_body, possibly one zstd frame
///     digest   32 byte BLAKE3 of everything above
///
/// Saving writes a sibling temporary file and renames it over the blob, so a
/// failed save never damages an earlier successful one.

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include "codalign/compression.hpp"
#include "codalign/config.hpp"
#include "codalign/corpus.hpp"
#include "codalign/digest.hpp"
#include "codalign/errors.hpp"
#include "codalign/serialization.hpp"
#include "codalign/version.hpp"

namespace codalign {

/// Facts about a blob that can be reported without keeping the corpus.
struct CacheInfo {
    std::uint32_t format_version{0};
    std::uint64_t count{0};
    bool compressed{false};
    bool has_waveforms{false};
    std::size_t embedding_dim{0};
    std::uintmax_t file_bytes{0};
};

class CacheStore {
  public:
    explicit CacheStore(std::filesystem::path cache_dir) : dir_{std::move(cache_dir)} {}

    const std::filesystem::path& dir() const { return dir_; }
    std::filesystem::path blob_path() const { return dir_ / CODALIGN_CACHE_FILE_NAME; }
    std::filesystem::path audit_path() const { return dir_ / CODALIGN_AUDIT_FILE_NAME; }

    bool exists() const {
        std::error_code ec;
        return std::filesystem::is_regular_file(blob_path(), ec);
    }

    /// Persist @p corpus, replacing any previous blob only once the new one is complete.
    void save(const Corpus& corpus, bool compress = false, bool include_waveforms = false) const {
        std::ostringstream body;
        try {
            write_corpus_body(body, corpus, include_waveforms);
        } catch (const std::exception& e) {
            throw CacheError(std::string("cannot serialise corpus: ") + e.what());
        }
        std::string payload = body.str();
        if (compress)
            payload = compress_bytes(payload);

        std::string blob;
        blob.reserve(payload.size() + 16 + BLAKE3_OUT_LEN);
        blob.append(compress ? "ALGZ" : "ALGN", 4);
        std::uint32_t ver = cache_format_version();
        blob.append(reinterpret_cast<const char*>(&ver), sizeof(ver));
        std::uint64_t count = corpus.size();
        blob.append(reinterpret_cast<const char*>(&count), sizeof(count));
        blob += payload;
        Digest digest = blake3_digest(blob.data(), blob.size());
        blob.append(reinterpret_cast<const char*>(digest.data()), digest.size());

        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
        if (ec)
            throw CacheError("cannot create cache directory " + dir_.string() + ": " +
                             ec.message());

        auto final_path = blob_path();
        auto tmp_path = final_path;
        tmp_path += ".tmp";
        {
            std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
            if (!out)
                throw CacheError("cannot open " + tmp_path.string() + " for writing");
            out.write(blob.data(), static_cast<std::streamsize>(blob.size()));
            out.flush();
            if (!out) {
                out.close();
                std::filesystem::remove(tmp_path, ec);
                throw CacheError("failed to write " + tmp_path.string());
            }
        }
        std::filesystem::rename(tmp_path, final_path, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(tmp_path, ignored);
            throw CacheError("cannot move cache into place at " + final_path.string() + ": " +
                             ec.message());
        }
    }

    /// Read the blob back. Any missing, truncated or altered blob raises CacheError.
    Corpus load() const {
        CacheInfo info;
        return parse(read_blob(), info);
    }

    /// Parse the blob and describe it.
    CacheInfo inspect() const {
        CacheInfo info;
        Corpus corpus = parse(read_blob(), info);
        if (!corpus.speaker_embeddings.empty())
            info.embedding_dim = corpus.speaker_embeddings.front().numel();
        std::error_code ec;
        info.file_bytes = std::filesystem::file_size(blob_path(), ec);
        return info;
    }

    /// Write every candidate key, one per line.
    void write_audit(const std::vector<std::string>& keys) const {
        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
        std::ofstream out(audit_path(), std::ios::trunc);
        if (!out)
            throw CacheError("cannot write " + audit_path().string());
        for (const auto& k : keys)
            out << k << '\n';
        if (!out)
            throw CacheError("failed to write " + audit_path().string());
    }

    /// Hex BLAKE3 digest of the blob file as stored.
    std::string file_digest() const {
        if (!exists())
            throw CacheError("no corpus cache at " + blob_path().string());
        return hash_file(blob_path().string());
    }

  private:
    std::filesystem::path dir_{};

    static constexpr std::size_t kHeaderBytes = 4 + sizeof(std::uint32_t) + sizeof(std::uint64_t);

    std::string read_blob() const {
        if (!exists())
            throw CacheError("no corpus cache at " + blob_path().string());
        std::ifstream in(blob_path(), std::ios::binary);
        if (!in)
            throw CacheError("cannot open " + blob_path().string());
        std::string blob((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (blob.size() < kHeaderBytes + BLAKE3_OUT_LEN)
            throw CacheError("truncated corpus cache " + blob_path().string());
        return blob;
    }

    Corpus parse(const std::string& blob, CacheInfo& info) const {
        std::size_t content = blob.size() - BLAKE3_OUT_LEN;
        Digest expected = blake3_digest(blob.data(), content);
        if (std::memcmp(expected.data(), blob.data() + content, BLAKE3_OUT_LEN) != 0)
            throw CacheError("checksum mismatch in " + blob_path().string());

        if (std::memcmp(blob.data(), "ALGN", 4) == 0) {
            info.compressed = false;
        } else if (std::memcmp(blob.data(), "ALGZ", 4) == 0) {
            info.compressed = true;
        } else {
            throw CacheError("invalid corpus cache header in " + blob_path().string());
        }
        std::memcpy(&info.format_version, blob.data() + 4, sizeof(info.format_version));
        if (info.format_version != cache_format_version())
            throw CacheError("corpus cache " + blob_path().string() + " has format version " +
                             std::to_string(info.format_version) + ", expected " +
                             std::to_string(cache_format_version()) + "; rebuild it");
        std::memcpy(&info.count, blob.data() + 8, sizeof(info.count));

        try {
            const char* body = blob.data() + kHeaderBytes;
            std::size_t body_size = content - kHeaderBytes;
            std::istringstream in(info.compressed ? decompress_bytes(body, body_size)
                                                  : std::string(body, body_size));
            Corpus corpus = read_corpus_body(in, info.count);
            if (in.peek() != std::char_traits<char>::eof())
                throw std::runtime_error("extra data after corpus body");
            info.has_waveforms = !corpus.empty() && corpus.datapoints.front().waveform.numel() > 0;
            return corpus;
        } catch (const std::exception& e) {
            throw CacheError("malformed corpus cache " + blob_path().string() + ": " + e.what());
        }
    }
};

} // namespace codalign
