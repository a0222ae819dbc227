#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace codalign {

/// Called with a stage label, items finished and items in that stage.
using ProgressFn =
    std::function<void(const std::string& stage, std::size_t done, std::size_t total)>;

/**
 * Textual progress indicator.
 *
 * The callback operator can be assigned to CorpusOptions::progress. Each
 * stage gets one line that is rewritten in place and terminated once the
 * stage completes. Calls from several workers are serialised.
 */
class TextProgress {
  public:
    explicit TextProgress(std::ostream& out, std::size_t step = 1)
        : out_{&out}, step_{step == 0 ? 1 : step} {}

    void operator()(const std::string& stage, std::size_t done, std::size_t total) {
        std::lock_guard<std::mutex> lock(*mutex_);
        if (done != total && done % step_ != 0)
            return;
        *out_ << '\r' << stage << ": " << done << '/' << total;
        if (done == total)
            *out_ << '\n';
        out_->flush();
    }

  private:
    std::ostream* out_;
    std::size_t step_{1};
    std::shared_ptr<std::mutex> mutex_{std::make_shared<std::mutex>()};
};

/// Wrap a TextProgress into a ProgressFn writing to @p out.
inline ProgressFn make_text_progress(std::ostream& out, std::size_t step = 1) {
    return TextProgress{out, step};
}

} // namespace codalign
