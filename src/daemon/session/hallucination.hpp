#pragma once

#include <string_view>

// True for decoder output that is a known artifact of silence or noise
// rather than speech. Comparison is case-insensitive after trimming.
bool is_hallucination(std::string_view text);
