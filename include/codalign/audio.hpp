#pragma once

/**
 * @file audio.hpp
 * @brief Audio file reading and writing through libsndfile.
 *
 * Any container libsndfile understands (WAV, FLAC, OGG/Vorbis, AIFF, ...) can
 * be read. Multi-channel input is averaged down to mono since every consumer
 * of the corpus works on a single channel.
 */

#include <cstddef>
#include <memory>
#include <sndfile.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "codalign/collaborators.hpp"
#include "codalign/errors.hpp"

namespace codalign {

namespace detail {

struct SndfileCloser {
    void operator()(SNDFILE* f) const {
        if (f)
            sf_close(f);
    }
};

using SndfileHandle = std::unique_ptr<SNDFILE, SndfileCloser>;

/// Frames decoded per sf_readf_float call.
constexpr sf_count_t kReadBlockFrames = 4096;

} // namespace detail

/**
 * @brief Decode an audio file into mono float samples.
 *
 * Frames are read in fixed size blocks until the decoder runs dry, so a
 * header that overstates the payload never drives an allocation. Throws
 * AudioReadError for missing files and anything libsndfile cannot decode.
 */
inline AudioBuffer read_audio(const std::string& path) {
    SF_INFO info{};
    detail::SndfileHandle file{sf_open(path.c_str(), SFM_READ, &info)};
    if (!file)
        throw AudioReadError("failed to open audio file " + path + ": " + sf_strerror(nullptr));
    if (info.channels <= 0 || info.samplerate <= 0)
        throw AudioReadError("invalid audio header in " + path);

    const auto channels = static_cast<std::size_t>(info.channels);
    std::vector<float> block(static_cast<std::size_t>(detail::kReadBlockFrames) * channels);

    AudioBuffer out;
    out.sample_rate = info.samplerate;
    while (true) {
        sf_count_t got = sf_readf_float(file.get(), block.data(), detail::kReadBlockFrames);
        if (got <= 0)
            break;
        for (sf_count_t f = 0; f < got; ++f) {
            const float* frame = block.data() + static_cast<std::size_t>(f) * channels;
            float acc = 0.0f;
            for (std::size_t c = 0; c < channels; ++c)
                acc += frame[c];
            out.samples.push_back(acc / static_cast<float>(channels));
        }
    }
    if (sf_error(file.get()) != SF_ERR_NO_ERROR)
        throw AudioReadError("failed to decode " + path + ": " + sf_strerror(file.get()));
    return out;
}

/**
 * Write mono float samples with the given libsndfile major|subtype format.
 * Samples outside [-1, 1] are clipped.
 */
inline void save_audio(const std::string& path, const std::vector<float>& samples,
                       int sample_rate, int format) {
    SF_INFO info{};
    info.samplerate = sample_rate;
    info.channels = 1;
    info.format = format;
    if (!sf_format_check(&info))
        throw std::invalid_argument("libsndfile cannot write format " + std::to_string(format));
    detail::SndfileHandle file{sf_open(path.c_str(), SFM_WRITE, &info)};
    if (!file)
        throw std::runtime_error("failed to open " + path + " for writing: " +
                                 sf_strerror(nullptr));
    sf_command(file.get(), SFC_SET_CLIPPING, nullptr, SF_TRUE);
    auto frames = static_cast<sf_count_t>(samples.size());
    if (sf_writef_float(file.get(), samples.data(), frames) != frames)
        throw std::runtime_error("failed to write " + path + ": " + sf_strerror(file.get()));
}

/// Write mono float samples as 16-bit PCM WAV.
inline void save_wav16(const std::string& path, const std::vector<float>& samples,
                       int sample_rate) {
    save_audio(path, samples, sample_rate, SF_FORMAT_WAV | SF_FORMAT_PCM_16);
}

/** Default loader backed by libsndfile. */
class SndfileAudioLoader : public AudioLoader {
  public:
    AudioBuffer load(const std::string& path) override { return read_audio(path); }
};

} // namespace codalign
