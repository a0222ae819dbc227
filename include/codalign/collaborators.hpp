#pragma once

/// \file collaborators.hpp
/// \brief Interfaces of the models the corpus builder drives.
///
/// The text frontend, the audio codec and the speaker embedding extractor are
/// heavyweight models that live outside this library. The builder only needs
/// the narrow contracts below. Every worker asks the factories in
/// @ref Collaborators for its own instances so no model object is ever used
/// by two workers at once.

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "codalign/core.hpp"

namespace codalign {

/// Decoded audio as mono float samples in [-1, 1].
struct AudioBuffer {
    std::vector<float> samples{};
    int sample_rate{0};

    double duration_seconds() const {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

/// Discrete speech codes laid out row-major as [frames, codebook depth].
struct CodeMatrix {
    std::vector<std::int16_t> codes{};
    std::size_t frames{0};
    std::size_t depth{0};
};

/** Converts transcripts into token id sequences. */
class TextFrontend {
  public:
    virtual ~TextFrontend() = default;

    /**
     * Encode @p text into token ids.
     *
     * With @p handle_missing false an unknown symbol raises
     * UnknownSymbolError. With it true unknown symbols are replaced by a
     * placeholder token. Other failures raise TextEncodingError.
     */
    virtual std::vector<std::int16_t> encode(const std::string& text, bool handle_missing,
                                             bool phone_input) = 0;
};

/** Lossy audio codec working on discrete code indices. */
class CodecModel {
  public:
    virtual ~CodecModel() = default;

    /// Encode a waveform sampled at @p sample_rate. Raises CodecError.
    virtual CodeMatrix encode(const std::vector<float>& wave, int sample_rate) = 0;

    /// Turn an Int16 [frames, depth] code tensor into Float32 [frames, dim] features.
    virtual HTensor decode(const HTensor& codes) = 0;
};

/** Produces one fixed length speaker vector per waveform. */
class SpeakerEmbedder {
  public:
    virtual ~SpeakerEmbedder() = default;
    virtual std::vector<float> embed(const std::vector<float>& wave) = 0;
};

/** Reads an audio file. Raises AudioReadError. */
class AudioLoader {
  public:
    virtual ~AudioLoader() = default;
    virtual AudioBuffer load(const std::string& path) = 0;
};

/** Changes the sample rate of a waveform. Raises ResampleError. */
class Resampler {
  public:
    virtual ~Resampler() = default;
    virtual std::vector<float> resample(const std::vector<float>& wave, int src_rate,
                                        int dst_rate) = 0;
};

/// Codec input rate passed to the factory when only decoding is needed.
inline constexpr int kDecodeOnly = -1;

/**
 * @brief Factories for every external model.
 *
 * Factories may be called concurrently from several workers and must return
 * independent instances. The loader and resampler factories are optional;
 * the libsndfile reader and sinc resampler are used when they are empty.
 */
struct Collaborators {
    std::function<std::unique_ptr<TextFrontend>(const std::string& lang)> make_frontend{};
    std::function<std::unique_ptr<CodecModel>(int input_sample_rate, const std::string& device)>
        make_codec{};
    std::function<std::unique_ptr<SpeakerEmbedder>(const std::string& device)> make_embedder{};
    std::function<std::unique_ptr<AudioLoader>()> make_loader{};
    std::function<std::unique_ptr<Resampler>(int src_rate, int dst_rate,
                                             const std::string& device)>
        make_resampler{};
};

} // namespace codalign
