#include "wakeword/dtw.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace dtw {

namespace {

constexpr float kTinyNorm = 1e-6f;

} // namespace

float cosine_distance(const features::Frame& a, const features::Frame& b) {
    double dot = 0.0, na = 0.0, nb = 0.0;
    const size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    na = std::sqrt(na);
    nb = std::sqrt(nb);
    if (na < kTinyNorm && nb < kTinyNorm) return 0.0f;
    if (na < kTinyNorm || nb < kTinyNorm) return 1.0f;
    return static_cast<float>(1.0 - dot / (na * nb));
}

float distance(const features::Matrix& a, const features::Matrix& b) {
    constexpr float inf = std::numeric_limits<float>::infinity();
    const size_t n = a.size(), m = b.size();
    if (n == 0 || m == 0) return inf;

    size_t longer = std::max(n, m);
    size_t diff = longer - std::min(n, m);
    size_t band = std::max(diff + 1, longer / 4);

    // Two rows of the cost matrix, plus matching step counts for normalization
    std::vector<float> prev(m + 1, inf), cur(m + 1, inf);
    std::vector<uint32_t> prev_len(m + 1, 0), cur_len(m + 1, 0);
    prev[0] = 0.0f;

    for (size_t i = 1; i <= n; ++i) {
        std::fill(cur.begin(), cur.end(), inf);
        // Diagonal of the band, scaled to the aspect ratio
        size_t centre = i * m / n;
        size_t lo = centre > band ? centre - band : 1;
        size_t hi = std::min(m, centre + band);
        for (size_t j = std::max<size_t>(lo, 1); j <= hi; ++j) {
            float best = prev[j - 1];
            uint32_t len = prev_len[j - 1];
            if (prev[j] < best) { best = prev[j]; len = prev_len[j]; }
            if (cur[j - 1] < best) { best = cur[j - 1]; len = cur_len[j - 1]; }
            if (best == inf) continue;
            cur[j] = best + cosine_distance(a[i - 1], b[j - 1]);
            cur_len[j] = len + 1;
        }
        std::swap(prev, cur);
        std::swap(prev_len, cur_len);
        prev[0] = inf;
    }

    if (prev[m] == inf || prev_len[m] == 0) return inf;
    return prev[m] / static_cast<float>(prev_len[m]);
}

float similarity(features::Matrix a, features::Matrix b) {
    features::mean_normalize(a);
    features::mean_normalize(b);
    float d = distance(a, b);
    if (!std::isfinite(d)) return 0.0f;
    return std::max(0.0f, 1.0f - d);
}

} // namespace dtw
