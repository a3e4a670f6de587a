#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace resample {

// Polyphase windowed-sinc converter for a rational rate ratio.
// Filter state lives only for the duration of one process() call.
class Polyphase {
public:
    Polyphase(uint32_t in_rate, uint32_t out_rate);

    // Number of output samples process() produces for `in_len` input samples.
    size_t output_len(size_t in_len) const;

    // Writes output_len(in.size()) samples into `out`, returns the count produced.
    size_t process(std::span<const float> in, std::span<float> out) const;

    uint32_t up() const { return up_; }
    uint32_t down() const { return down_; }

private:
    uint32_t up_;
    uint32_t down_;
    std::vector<float> taps_; // prototype low-pass at in_rate * up_
};

// Converts a complete mono buffer. Empty input yields empty output.
std::vector<float> convert(std::span<const float> in, uint32_t in_rate, uint32_t out_rate);

} // namespace resample
