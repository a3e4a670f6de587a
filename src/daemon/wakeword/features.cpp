#include "wakeword/features.hpp"

#include "audio/vad.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <numbers>

namespace features {

namespace {

constexpr size_t kMels = 26;
constexpr float kMinHz = 20.0f;
constexpr float kMaxHz = 8000.0f;
constexpr float kEnergyFloor = 1e-10f;

float hz_to_mel(float hz) { return 2595.0f * std::log10(1.0f + hz / 700.0f); }
float mel_to_hz(float mel) { return 700.0f * (std::pow(10.0f, mel / 2595.0f) - 1.0f); }

size_t next_pow2(size_t n) {
    size_t p = 1;
    while (p < n) p <<= 1;
    return p;
}

// In-place iterative radix-2 Cooley-Tukey. data.size() must be a power of two.
void fft(std::vector<std::complex<float>>& data) {
    const size_t n = data.size();
    for (size_t i = 1, j = 0; i < n; ++i) {
        size_t bit = n >> 1;
        for (; j & bit; bit >>= 1) j ^= bit;
        j ^= bit;
        if (i < j) std::swap(data[i], data[j]);
    }

    for (size_t len = 2; len <= n; len <<= 1) {
        double ang = -2.0 * std::numbers::pi / static_cast<double>(len);
        std::complex<float> wlen(static_cast<float>(std::cos(ang)), static_cast<float>(std::sin(ang)));
        for (size_t i = 0; i < n; i += len) {
            std::complex<float> w(1.0f, 0.0f);
            for (size_t k = 0; k < len / 2; ++k) {
                auto u = data[i + k];
                auto v = data[i + k + len / 2] * w;
                data[i + k] = u + v;
                data[i + k + len / 2] = u - v;
                w *= wlen;
            }
        }
    }
}

} // namespace

MfccExtractor::MfccExtractor(uint32_t sample_rate, size_t n_coeffs)
    : sample_rate_(sample_rate), n_coeffs_(n_coeffs), n_mels_(std::max(kMels, n_coeffs)) {
    frame_len_ = static_cast<size_t>(sample_rate_) * kFrameMs / 1000;
    hop_len_ = static_cast<size_t>(sample_rate_) * kHopMs / 1000;
    fft_size_ = next_pow2(frame_len_);

    window_.resize(frame_len_);
    for (size_t i = 0; i < frame_len_; ++i) {
        window_[i] = 0.5f * (1.0f - static_cast<float>(std::cos(2.0 * std::numbers::pi * i / (frame_len_ - 1))));
    }

    const size_t n_bins = fft_size_ / 2 + 1;
    float max_hz = std::min(kMaxHz, static_cast<float>(sample_rate_) / 2.0f);
    float mel_lo = hz_to_mel(kMinHz);
    float mel_hi = hz_to_mel(max_hz);

    std::vector<float> bin_of(n_mels_ + 2);
    for (size_t i = 0; i < n_mels_ + 2; ++i) {
        float mel = mel_lo + (mel_hi - mel_lo) * static_cast<float>(i) / static_cast<float>(n_mels_ + 1);
        bin_of[i] = mel_to_hz(mel) * static_cast<float>(fft_size_) / static_cast<float>(sample_rate_);
    }

    mel_bank_.assign(n_mels_, std::vector<float>(n_bins, 0.0f));
    for (size_t m = 0; m < n_mels_; ++m) {
        float left = bin_of[m], center = bin_of[m + 1], right = bin_of[m + 2];
        for (size_t k = 0; k < n_bins; ++k) {
            float f = static_cast<float>(k);
            if (f > left && f < center) {
                mel_bank_[m][k] = (f - left) / (center - left);
            } else if (f >= center && f < right) {
                mel_bank_[m][k] = (right - f) / (right - center);
            }
        }
    }
}

Matrix MfccExtractor::push(std::span<const float> samples, std::vector<float>* frame_rms) {
    pending_.insert(pending_.end(), samples.begin(), samples.end());

    Matrix out;
    size_t offset = 0;
    while (pending_.size() - offset >= frame_len_) {
        std::span<const float> frame(pending_.data() + offset, frame_len_);
        out.push_back(analyze(frame));
        if (frame_rms) frame_rms->push_back(vad::rms(frame));
        offset += hop_len_;
    }
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(offset));
    return out;
}

Matrix MfccExtractor::compute(std::span<const float> samples) const {
    Matrix out;
    for (size_t offset = 0; offset + frame_len_ <= samples.size(); offset += hop_len_) {
        out.push_back(analyze(samples.subspan(offset, frame_len_)));
    }
    return out;
}

Frame MfccExtractor::analyze(std::span<const float> frame) const {
    std::vector<std::complex<float>> bins(fft_size_);
    for (size_t i = 0; i < frame_len_; ++i) bins[i] = frame[i] * window_[i];
    fft(bins);

    const size_t n_bins = fft_size_ / 2 + 1;
    std::vector<float> log_mel(n_mels_);
    for (size_t m = 0; m < n_mels_; ++m) {
        float energy = 0.0f;
        for (size_t k = 0; k < n_bins; ++k) {
            if (mel_bank_[m][k] != 0.0f) energy += std::norm(bins[k]) * mel_bank_[m][k];
        }
        log_mel[m] = std::log(std::max(energy, kEnergyFloor));
    }

    Frame coeffs(n_coeffs_);
    const double scale = std::numbers::pi / static_cast<double>(n_mels_);
    for (size_t c = 0; c < n_coeffs_; ++c) {
        double acc = 0.0;
        for (size_t m = 0; m < n_mels_; ++m) {
            acc += log_mel[m] * std::cos(scale * (static_cast<double>(m) + 0.5) * static_cast<double>(c));
        }
        coeffs[c] = static_cast<float>(acc);
    }
    return coeffs;
}

void mean_normalize(Matrix& m) {
    if (m.empty()) return;
    const size_t width = m.front().size();
    std::vector<double> mean(width, 0.0);
    for (const auto& f : m) {
        for (size_t c = 0; c < width; ++c) mean[c] += f[c];
    }
    for (auto& v : mean) v /= static_cast<double>(m.size());
    for (auto& f : m) {
        for (size_t c = 0; c < width; ++c) f[c] -= static_cast<float>(mean[c]);
    }
}

} // namespace features
