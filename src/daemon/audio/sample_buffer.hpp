#pragma once

#include <cstddef>
#include <mutex>
#include <span>
#include <vector>

// Growable PCM buffer shared between the device callback (append) and
// readers on other threads (snapshot). Snapshots always see a complete
// prefix of what was appended.
class SampleBuffer {
public:
    void append(std::span<const float> samples) {
        std::lock_guard lock(mutex_);
        samples_.insert(samples_.end(), samples.begin(), samples.end());
    }

    std::vector<float> snapshot() const {
        std::lock_guard lock(mutex_);
        return samples_;
    }

    // Copy and clear in one step, so no appended frame is lost in between.
    std::vector<float> take() {
        std::lock_guard lock(mutex_);
        std::vector<float> out;
        out.swap(samples_);
        return out;
    }

    void clear() {
        std::lock_guard lock(mutex_);
        samples_.clear();
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return samples_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<float> samples_;
};
