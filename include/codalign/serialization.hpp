#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "codalign/core.hpp"
#include "codalign/corpus.hpp"

namespace codalign {

inline void write_string(std::ostream& out, const std::string& s) {
    std::uint32_t len = static_cast<std::uint32_t>(s.size());
    out.write(reinterpret_cast<const char*>(&len), sizeof(len));
    out.write(s.data(), len);
}

inline std::string read_string(std::istream& in) {
    std::uint32_t len;
    in.read(reinterpret_cast<char*>(&len), sizeof(len));
    if (!in)
        throw std::runtime_error("failed to read string length");
    std::string s(len, '\0');
    in.read(s.data(), len);
    if (!in)
        throw std::runtime_error("failed to read string data");
    return s;
}

inline void write_tensor(std::ostream& out, const HTensor& t) {
    std::uint8_t dt = static_cast<std::uint8_t>(t.dtype());
    out.write(reinterpret_cast<const char*>(&dt), sizeof(dt));
    std::uint32_t dims = static_cast<std::uint32_t>(t.shape().size());
    out.write(reinterpret_cast<const char*>(&dims), sizeof(dims));
    for (auto d : t.shape()) {
        std::uint32_t dim = static_cast<std::uint32_t>(d);
        out.write(reinterpret_cast<const char*>(&dim), sizeof(dim));
    }
    std::uint32_t size = static_cast<std::uint32_t>(t.data().size());
    out.write(reinterpret_cast<const char*>(&size), sizeof(size));
    out.write(reinterpret_cast<const char*>(t.data().data()), size);
}

inline HTensor read_tensor(std::istream& in) {
    std::uint8_t dt;
    in.read(reinterpret_cast<char*>(&dt), sizeof(dt));
    std::uint32_t dims;
    in.read(reinterpret_cast<char*>(&dims), sizeof(dims));
    if (!in)
        throw std::runtime_error("failed to read tensor header");
    if (dt > static_cast<std::uint8_t>(HTensor::DType::UInt8))
        throw std::runtime_error("unknown tensor dtype " + std::to_string(dt));
    HTensor::Shape shape(dims);
    std::uint64_t elems = dims == 0 ? 0 : 1;
    for (std::uint32_t i = 0; i < dims; ++i) {
        std::uint32_t dim;
        in.read(reinterpret_cast<char*>(&dim), sizeof(dim));
        if (!in)
            throw std::runtime_error("failed to read tensor shape");
        shape[i] = dim;
        elems *= dim;
    }
    std::uint32_t size;
    in.read(reinterpret_cast<char*>(&size), sizeof(size));
    if (!in)
        throw std::runtime_error("failed to read tensor size");
    auto type = static_cast<HTensor::DType>(dt);
    if (elems * dtype_size(type) != size)
        throw std::runtime_error("tensor " + shape_to_string(shape) + " holds " +
                                 std::to_string(size) + " bytes");
    std::vector<std::byte> data(size);
    in.read(reinterpret_cast<char*>(data.data()), size);
    if (!in)
        throw std::runtime_error("failed to read tensor data");
    return HTensor{type, std::move(shape), std::move(data)};
}

/// Tag of the reserved slot between datapoints and embeddings.
enum class ReservedSlot : std::uint8_t { None = 0, Waveforms = 1 };

/**
 * Write the four corpus slots in order: (tokens, codes) pairs, the reserved
 * slot, speaker embeddings and source paths. The record count is not part of
 * the body and has to be stored by the caller.
 */
inline void write_corpus_body(std::ostream& out, const Corpus& corpus, bool include_waveforms) {
    if (corpus.speaker_embeddings.size() != corpus.datapoints.size())
        throw std::invalid_argument("corpus has " + std::to_string(corpus.datapoints.size()) +
                                    " datapoints but " +
                                    std::to_string(corpus.speaker_embeddings.size()) +
                                    " embeddings");
    for (const auto& dp : corpus.datapoints) {
        write_tensor(out, dp.tokens);
        write_tensor(out, dp.speech_codes);
    }
    auto slot = include_waveforms ? ReservedSlot::Waveforms : ReservedSlot::None;
    std::uint8_t tag = static_cast<std::uint8_t>(slot);
    out.write(reinterpret_cast<const char*>(&tag), sizeof(tag));
    if (slot == ReservedSlot::Waveforms)
        for (const auto& dp : corpus.datapoints)
            write_tensor(out, dp.waveform);
    for (const auto& e : corpus.speaker_embeddings)
        write_tensor(out, e);
    for (const auto& dp : corpus.datapoints)
        write_string(out, dp.path);
}

/// Inverse of write_corpus_body. Datapoints without cached waveforms get an empty one.
inline Corpus read_corpus_body(std::istream& in, std::uint64_t count) {
    Corpus corpus;
    corpus.datapoints.resize(static_cast<std::size_t>(count));
    for (auto& dp : corpus.datapoints) {
        dp.tokens = read_tensor(in);
        dp.speech_codes = read_tensor(in);
    }
    std::uint8_t tag;
    in.read(reinterpret_cast<char*>(&tag), sizeof(tag));
    if (!in)
        throw std::runtime_error("failed to read reserved slot");
    if (tag == static_cast<std::uint8_t>(ReservedSlot::Waveforms)) {
        for (auto& dp : corpus.datapoints)
            dp.waveform = read_tensor(in);
    } else if (tag == static_cast<std::uint8_t>(ReservedSlot::None)) {
        for (auto& dp : corpus.datapoints)
            dp.waveform = HTensor{HTensor::DType::Float32, {0}};
    } else {
        throw std::runtime_error("unknown reserved slot tag " + std::to_string(tag));
    }
    corpus.speaker_embeddings.reserve(static_cast<std::size_t>(count));
    for (std::uint64_t i = 0; i < count; ++i)
        corpus.speaker_embeddings.push_back(read_tensor(in));
    for (auto& dp : corpus.datapoints)
        dp.path = read_string(in);
    return corpus;
}

} // namespace codalign
