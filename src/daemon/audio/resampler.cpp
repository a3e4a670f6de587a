#include "audio/resampler.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <numeric>

namespace resample {

namespace {

// Zero crossings of the sinc kernel kept on each side, in output periods.
constexpr int kHalfWidth = 32;
constexpr double kCutoffScale = 0.92;

} // namespace

Polyphase::Polyphase(uint32_t in_rate, uint32_t out_rate) {
    uint32_t g = std::gcd(in_rate, out_rate);
    up_ = out_rate / g;
    down_ = in_rate / g;

    uint32_t factor = std::max(up_, down_);
    size_t n = 2 * static_cast<size_t>(kHalfWidth) * factor + 1;
    double fc = 0.5 / factor * kCutoffScale; // cycles per upsampled sample
    double center = static_cast<double>(n - 1) / 2.0;

    taps_.resize(n);
    for (size_t k = 0; k < n; ++k) {
        double x = static_cast<double>(k) - center;
        double sinc = x == 0.0 ? 2.0 * fc
                               : std::sin(2.0 * std::numbers::pi * fc * x) / (std::numbers::pi * x);
        double phase = 2.0 * std::numbers::pi * static_cast<double>(k) / static_cast<double>(n - 1);
        double blackman = 0.42 - 0.5 * std::cos(phase) + 0.08 * std::cos(2.0 * phase);
        taps_[k] = static_cast<float>(sinc * blackman * up_);
    }
}

size_t Polyphase::output_len(size_t in_len) const {
    if (in_len == 0) return 0;
    return (in_len * up_ + down_ - 1) / down_;
}

size_t Polyphase::process(std::span<const float> in, std::span<float> out) const {
    size_t produced = std::min(output_len(in.size()), out.size());
    if (produced == 0) return 0;

    const int64_t n_taps = static_cast<int64_t>(taps_.size());
    const int64_t delay = (n_taps - 1) / 2;
    const int64_t up_len = static_cast<int64_t>(in.size()) * up_;
    const int64_t up = up_;

    for (size_t m = 0; m < produced; ++m) {
        // Position in the zero-stuffed signal, shifted to cancel the filter delay
        int64_t t = static_cast<int64_t>(m) * down_ + delay;
        int64_t k_min = std::max<int64_t>(0, t - (up_len - 1));
        int64_t k_max = std::min<int64_t>(n_taps - 1, t);
        if (k_min > k_max) {
            out[m] = 0.0f;
            continue;
        }

        int64_t k = k_min + ((t - k_min) % up);
        double acc = 0.0;
        for (; k <= k_max; k += up) {
            acc += static_cast<double>(taps_[static_cast<size_t>(k)]) * in[static_cast<size_t>((t - k) / up)];
        }
        out[m] = static_cast<float>(acc);
    }
    return produced;
}

std::vector<float> convert(std::span<const float> in, uint32_t in_rate, uint32_t out_rate) {
    if (in.empty()) return {};
    if (in_rate == out_rate) return {in.begin(), in.end()};

    Polyphase converter(in_rate, out_rate);
    std::vector<float> out(converter.output_len(in.size()));
    size_t produced = converter.process(in, out);
    out.resize(produced);
    return out;
}

} // namespace resample
