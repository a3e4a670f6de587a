#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace features {

constexpr size_t kDefaultCoeffs = 13;
constexpr uint32_t kFrameMs = 25;
constexpr uint32_t kHopMs = 10;

using Frame = std::vector<float>;
using Matrix = std::vector<Frame>; // time x coefficients

// MFCC front end: Hann window, power spectrum, mel filterbank, log, DCT-II.
// push() is the streaming form; compute() handles a whole buffer at once.
class MfccExtractor {
public:
    explicit MfccExtractor(uint32_t sample_rate, size_t n_coeffs = kDefaultCoeffs);

    // Returns the frames completed by these samples. When `frame_rms` is set
    // it receives the RMS of each returned frame's raw samples.
    Matrix push(std::span<const float> samples, std::vector<float>* frame_rms = nullptr);

    Matrix compute(std::span<const float> samples) const;

    void reset() { pending_.clear(); }

    uint32_t sample_rate() const { return sample_rate_; }
    size_t n_coeffs() const { return n_coeffs_; }
    size_t frame_len() const { return frame_len_; }
    size_t hop_len() const { return hop_len_; }

private:
    Frame analyze(std::span<const float> frame) const;

    uint32_t sample_rate_;
    size_t n_coeffs_;
    size_t n_mels_;
    size_t frame_len_;
    size_t hop_len_;
    size_t fft_size_;

    std::vector<float> window_;
    std::vector<std::vector<float>> mel_bank_; // n_mels x (fft_size/2 + 1)
    std::vector<float> pending_;
};

// Subtracts the per-coefficient mean over time (cepstral mean normalization).
void mean_normalize(Matrix& m);

} // namespace features
