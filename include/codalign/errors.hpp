#pragma once

#include <stdexcept>
#include <string>

namespace codalign {

// Per-sample failures. Raised by collaborators and turned into skips by the
// sample filter.

/// Audio file could not be opened or decoded.
struct AudioReadError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// Resampling produced no usable waveform.
struct ResampleError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// Transcript contains a symbol the text frontend does not know.
struct UnknownSymbolError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// Any other text frontend failure, e.g. a syllabification that does not parse.
struct TextEncodingError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// The audio codec rejected a waveform or a code matrix.
struct CodecError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// Terminates one worker partition.
struct PartitionError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// Construction produced no datapoints at all.
struct EmptyCorpusError : std::runtime_error {
    EmptyCorpusError()
        : std::runtime_error("no datapoints survived filtering, refusing to write an empty cache") {}
};

/// Cache blob missing, malformed or not writable.
struct CacheError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

} // namespace codalign
