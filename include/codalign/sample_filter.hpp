#pragma once

/// \file sample_filter.hpp
/// \brief Per-partition filtering and feature extraction.
///
/// A SampleFilter runs inside one worker. It walks the keys assigned to that
/// worker in order, rejects samples that fail any stage and extracts tokens,
/// speech codes and the canonical-rate waveform for the rest. The worker's
/// models are created inside run() and never leave it.
///
/// Stages per key:
///  1. transcript must be non-empty after trimming
///  2. audio must load
///  3. native rate must equal the partition rate
///  4. native duration must lie in [min_len, max_len]
///  5. resample to the canonical rate
///  6. resampled duration must lie in [min_len, max_len]
///  7. strict text encoding, then permissive if unknown symbols are allowed
///  8. codec encoding of the original waveform

#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "codalign/audio.hpp"
#include "codalign/collaborators.hpp"
#include "codalign/config.hpp"
#include "codalign/errors.hpp"
#include "codalign/progress.hpp"
#include "codalign/resample.hpp"

namespace codalign {

/// Audio path to transcript. Ordered so that key lists are reproducible.
using PathToTranscriptMap = std::map<std::string, std::string>;

struct FilterOptions {
    std::string lang{"eng"};
    std::string device{"cpu"};
    double min_len_seconds{1.0};
    double max_len_seconds{15.0};
    bool verbose{false};
    bool phone_input{false};
    bool allow_unknown_symbols{false};
    int target_sample_rate{canonical_sample_rate()};
    /// 0 takes the rate of the first file in the partition.
    int expected_sample_rate{0};
};

/// Worker-local result for one accepted sample.
struct RawDatapoint {
    std::vector<std::int16_t> tokens{};
    CodeMatrix speech_codes{};
    std::vector<float> waveform{};
    std::string path{};
};

enum class SkipReason {
    EmptyTranscript,
    UnreadableAudio,
    SampleRateMismatch,
    DurationOutOfBounds,
    ResampleFailed,
    ResampledDurationOutOfBounds,
    UnknownSymbols,
    TextEncodingFailed,
    CodecFailed,
};

inline constexpr std::size_t kSkipReasonCount = 9;

inline const char* skip_reason_name(SkipReason r) {
    switch (r) {
    case SkipReason::EmptyTranscript:
        return "empty transcript";
    case SkipReason::UnreadableAudio:
        return "unreadable audio";
    case SkipReason::SampleRateMismatch:
        return "sample rate mismatch";
    case SkipReason::DurationOutOfBounds:
        return "duration out of bounds";
    case SkipReason::ResampleFailed:
        return "resampling failed";
    case SkipReason::ResampledDurationOutOfBounds:
        return "resampled duration out of bounds";
    case SkipReason::UnknownSymbols:
        return "unknown symbols";
    case SkipReason::TextEncodingFailed:
        return "text encoding failed";
    case SkipReason::CodecFailed:
    default:
        return "codec failed";
    }
}

/// Outcome of one worker partition.
struct WorkerReport {
    std::size_t worker{0};
    std::size_t assigned{0};
    std::size_t kept{0};
    std::array<std::size_t, kSkipReasonCount> skipped{};
    /// Set when the partition aborted; its datapoints are lost.
    std::string failure{};

    std::size_t skip_count(SkipReason r) const { return skipped[static_cast<std::size_t>(r)]; }

    std::size_t total_skipped() const {
        std::size_t n = 0;
        for (auto s : skipped)
            n += s;
        return n;
    }
};

namespace detail {

/// Byte length of the whitespace code point starting at @p i, or 0.
inline std::size_t space_at(std::string_view s, std::size_t i) {
    auto u = [&](std::size_t k) { return static_cast<unsigned char>(s[k]); };
    if (std::isspace(u(i)))
        return 1;
    std::size_t left = s.size() - i;
    if (left >= 2 && u(i) == 0xC2 && (u(i + 1) == 0x85 || u(i + 1) == 0xA0))
        return 2; // U+0085, U+00A0
    if (left < 3)
        return 0;
    unsigned c0 = u(i), c1 = u(i + 1), c2 = u(i + 2);
    if (c0 == 0xE1 && c1 == 0x9A && c2 == 0x80)
        return 3; // U+1680
    if (c0 == 0xE2 && c1 == 0x80 &&
        (c2 <= 0x8A || c2 == 0xA8 || c2 == 0xA9 || c2 == 0xAF))
        return 3; // U+2000..U+200A, U+2028, U+2029, U+202F
    if (c0 == 0xE2 && c1 == 0x81 && c2 == 0x9F)
        return 3; // U+205F
    if (c0 == 0xE3 && c1 == 0x80 && c2 == 0x80)
        return 3; // U+3000
    return 0;
}

/// Byte length of the whitespace code point ending just before @p end, or 0.
inline std::size_t space_before(std::string_view s, std::size_t end) {
    for (std::size_t n = 1; n <= 3 && n <= end; ++n)
        if (space_at(s, end - n) == n)
            return n;
    return 0;
}

} // namespace detail

/// Strip ASCII and Unicode whitespace from both ends of a UTF-8 string.
inline std::string trim_ws(std::string_view s) {
    std::size_t b = 0;
    while (b < s.size()) {
        std::size_t n = detail::space_at(s, b);
        if (n == 0)
            break;
        b += n;
    }
    std::size_t e = s.size();
    while (e > b) {
        std::size_t n = detail::space_before(s, e);
        if (n == 0 || e - n < b)
            break;
        e -= n;
    }
    return std::string(s.substr(b, e - b));
}

class SampleFilter {
  public:
    SampleFilter(const PathToTranscriptMap& transcripts, FilterOptions options,
                 const Collaborators& collaborators)
        : transcripts_{transcripts}, options_{std::move(options)}, collab_{collaborators} {
        if (!collab_.make_frontend || !collab_.make_codec)
            throw std::invalid_argument("text frontend and codec factories are required");
    }

    /**
     * Filter and encode every key of one partition.
     *
     * Per-sample failures are counted in @p report and skipped. Throws
     * PartitionError when the partition rate has to be taken from the first
     * file and that file cannot be read.
     */
    std::vector<RawDatapoint> run(const std::vector<std::string>& keys, WorkerReport& report,
                                  const ProgressFn& progress = {}) {
        std::vector<RawDatapoint> chunk;
        report.assigned = keys.size();
        if (keys.empty())
            return chunk;

        auto loader = collab_.make_loader ? collab_.make_loader()
                                          : std::make_unique<SndfileAudioLoader>();

        int assumed_sr = options_.expected_sample_rate;
        if (assumed_sr <= 0) {
            try {
                assumed_sr = loader->load(keys.front()).sample_rate;
            } catch (const std::exception& e) {
                throw PartitionError("cannot establish sample rate of partition from " +
                                     keys.front() + ": " + e.what());
            }
        }

        auto frontend = collab_.make_frontend(options_.lang);
        auto codec = collab_.make_codec(assumed_sr, options_.device);
        auto resampler =
            collab_.make_resampler
                ? collab_.make_resampler(assumed_sr, options_.target_sample_rate, options_.device)
                : std::make_unique<SincResampler>();
        if (!frontend || !codec || !resampler)
            throw PartitionError("collaborator factory returned no instance");

        std::string stage = "worker " + std::to_string(report.worker);
        for (std::size_t i = 0; i < keys.size(); ++i) {
            RawDatapoint dp;
            SkipReason reason = SkipReason::EmptyTranscript;
            if (process(keys[i], assumed_sr, *loader, *frontend, *codec, *resampler, dp, reason)) {
                chunk.push_back(std::move(dp));
                ++report.kept;
            } else {
                ++report.skipped[static_cast<std::size_t>(reason)];
            }
            if (progress)
                progress(stage, i + 1, keys.size());
        }
        return chunk;
    }

  private:
    const PathToTranscriptMap& transcripts_;
    FilterOptions options_{};
    const Collaborators& collab_;

    bool in_bounds(double seconds) const {
        return options_.min_len_seconds <= seconds && seconds <= options_.max_len_seconds;
    }

    void note(const std::string& msg) const {
        if (options_.verbose)
            std::cerr << msg << '\n';
    }

    static std::string seconds_str(double s) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << s;
        return oss.str();
    }

    bool process(const std::string& path, int assumed_sr, AudioLoader& loader,
                 TextFrontend& frontend, CodecModel& codec, Resampler& resampler,
                 RawDatapoint& out, SkipReason& reason) const {
        const std::string& transcript = transcripts_.at(path);
        if (trim_ws(transcript).empty()) {
            reason = SkipReason::EmptyTranscript;
            return false;
        }

        AudioBuffer audio;
        try {
            audio = loader.load(path);
        } catch (const std::exception& e) {
            note("Problem with an audio file: " + path + " (" + e.what() + ")");
            reason = SkipReason::UnreadableAudio;
            return false;
        }

        if (audio.sample_rate != assumed_sr) {
            note(path + " has a different sampling rate --> skipping");
            reason = SkipReason::SampleRateMismatch;
            return false;
        }

        double duration = audio.duration_seconds();
        if (!in_bounds(duration)) {
            note("Excluding " + path + " because of its duration of " + seconds_str(duration) +
                 " seconds.");
            reason = SkipReason::DurationOutOfBounds;
            return false;
        }

        std::vector<float> norm_wave;
        try {
            norm_wave = resampler.resample(audio.samples, audio.sample_rate,
                                           options_.target_sample_rate);
        } catch (const ResampleError& e) {
            note("Resampling failed for " + path + ": " + e.what());
            reason = SkipReason::ResampleFailed;
            return false;
        }

        duration = static_cast<double>(norm_wave.size()) / options_.target_sample_rate;
        if (!in_bounds(duration)) {
            note("Excluding " + path + " because of its duration of " + seconds_str(duration) +
                 " seconds.");
            reason = SkipReason::ResampledDurationOutOfBounds;
            return false;
        }

        try {
            try {
                out.tokens = frontend.encode(transcript, false, options_.phone_input);
            } catch (const UnknownSymbolError&) {
                out.tokens = frontend.encode(transcript, true, options_.phone_input);
                if (!options_.allow_unknown_symbols) {
                    note("Excluding " + path + " because its transcript has unknown symbols.");
                    reason = SkipReason::UnknownSymbols;
                    return false;
                }
            }
        } catch (const UnknownSymbolError& e) {
            note("Text encoding failed for " + path + ": " + e.what());
            reason = SkipReason::TextEncodingFailed;
            return false;
        } catch (const TextEncodingError& e) {
            note("Text encoding failed for " + path + ": " + e.what());
            reason = SkipReason::TextEncodingFailed;
            return false;
        }

        try {
            out.speech_codes = codec.encode(audio.samples, audio.sample_rate);
        } catch (const CodecError& e) {
            note("Codec failed for " + path + ": " + e.what());
            reason = SkipReason::CodecFailed;
            return false;
        }

        out.waveform = std::move(norm_wave);
        out.path = path;
        return true;
    }
};

} // namespace codalign
