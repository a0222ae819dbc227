#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <string>
#include <vector>

#include "codalign/collaborators.hpp"
#include "codalign/errors.hpp"

namespace codalign {

/**
 * @brief Band-limited resampler using a Hann windowed sinc kernel.
 *
 * The kernel is low-passed at `rolloff` times the lower of the two Nyquist
 * frequencies. Output length is ceil(n * dst / src). Matching rates return
 * the input unchanged.
 */
class SincResampler : public Resampler {
  public:
    explicit SincResampler(int lowpass_filter_width = 6, double rolloff = 0.99)
        : width_{lowpass_filter_width}, rolloff_{rolloff} {}

    std::vector<float> resample(const std::vector<float>& wave, int src_rate,
                                int dst_rate) override {
        if (src_rate <= 0 || dst_rate <= 0)
            throw ResampleError("invalid sample rates " + std::to_string(src_rate) + " -> " +
                                std::to_string(dst_rate));
        if (src_rate == dst_rate)
            return wave;

        int g = std::gcd(src_rate, dst_rate);
        long long orig = src_rate / g;
        long long target = dst_rate / g;
        std::size_t n = wave.size();
        std::size_t out_len = static_cast<std::size_t>((static_cast<long long>(n) * target +
                                                        orig - 1) /
                                                       orig);

        const double pi = 3.14159265358979323846;
        double base_freq = std::min(orig, target) * rolloff_;
        double scale = base_freq / static_cast<double>(orig);
        // Kernel half width measured in input samples.
        long long reach =
            static_cast<long long>(std::ceil(width_ * static_cast<double>(orig) / base_freq));

        std::vector<float> out(out_len);
        for (std::size_t j = 0; j < out_len; ++j) {
            double t = static_cast<double>(j) * static_cast<double>(orig) /
                       static_cast<double>(target);
            long long first = std::max(0LL, static_cast<long long>(std::floor(t)) - reach);
            long long last = std::min(static_cast<long long>(n) - 1,
                                      static_cast<long long>(std::ceil(t)) + reach);
            double acc = 0.0;
            for (long long i = first; i <= last; ++i) {
                double arg = (static_cast<double>(i) - t) * scale;
                if (std::fabs(arg) > width_)
                    continue;
                double w = std::cos(arg * pi / width_ / 2.0);
                w *= w;
                double s = arg == 0.0 ? 1.0 : std::sin(pi * arg) / (pi * arg);
                acc += wave[static_cast<std::size_t>(i)] * w * s * scale;
            }
            if (!std::isfinite(acc))
                throw ResampleError("non-finite sample produced while resampling");
            out[j] = static_cast<float>(acc);
        }
        return out;
    }

  private:
    int width_{6};
    double rolloff_{0.99};
};

} // namespace codalign
