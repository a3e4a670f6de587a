#pragma once

#include "wakeword/features.hpp"

namespace dtw {

// 1 - cosine similarity, in [0, 2]. Two near-zero frames count as identical.
float cosine_distance(const features::Frame& a, const features::Frame& b);

// Length-normalized alignment cost between two sequences, restricted to a
// Sakoe-Chiba band wide enough to reach the far corner. Returns +inf when
// either sequence is empty.
float distance(const features::Matrix& a, const features::Matrix& b);

// Similarity in [0, 1]: max(0, 1 - distance) over mean-normalized copies.
float similarity(features::Matrix a, features::Matrix b);

} // namespace dtw
