#include "wakeword/lexical_matcher.hpp"

#include "audio/resampler.hpp"
#include "audio/vad.hpp"

#include <algorithm>
#include <cctype>
#include <print>
#include <sstream>

namespace {

// UTF-8 lead and continuation bytes count as letters; only ASCII is
// case-folded.
bool is_word_byte(unsigned char c) {
    return std::isalnum(c) != 0 || c >= 0x80;
}

// Decodes UTF-8 leniently: a malformed byte stands for itself.
std::u32string code_points(std::string_view s) {
    std::u32string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size();) {
        auto c = static_cast<unsigned char>(s[i]);
        size_t len = c < 0x80 ? 1 : (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xE ? 3 : (c >> 3) == 0x1E ? 4 : 1;
        if (i + len > s.size()) len = 1;

        char32_t cp = len == 1 ? c : c & (0x7F >> len);
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) {
                cp = c;
                len = 1;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        out += cp;
        i += len;
    }
    return out;
}

} // namespace

std::string normalize_text(std::string_view text) {
    std::string out;
    bool space = false;
    for (unsigned char c : text) {
        if (is_word_byte(c)) {
            if (space && !out.empty()) out += ' ';
            out += static_cast<char>(std::tolower(c));
            space = false;
        } else if (std::isspace(c)) {
            space = true;
        }
        // other punctuation is dropped without splitting words
    }
    return out;
}

size_t utf8_length(std::string_view s) {
    return code_points(s).size();
}

size_t levenshtein(std::string_view a_utf8, std::string_view b_utf8) {
    auto a = code_points(a_utf8);
    auto b = code_points(b_utf8);

    std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;

    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

namespace {

std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream in(s);
    for (std::string w; in >> w;) words.push_back(std::move(w));
    return words;
}

} // namespace

std::optional<std::string> find_phrase(std::string_view text,
                                       const std::vector<std::string>& phrases,
                                       float tolerance) {
    auto clean = normalize_text(text);
    if (clean.empty()) return std::nullopt;
    auto words = split_words(clean);

    for (const auto& raw : phrases) {
        auto phrase = normalize_text(raw);
        if (phrase.empty()) continue;

        if (clean.find(phrase) != std::string::npos) return raw;

        size_t width = std::max<size_t>(1, split_words(phrase).size());
        if (words.size() < width) continue;

        for (size_t i = 0; i + width <= words.size(); ++i) {
            std::string window = words[i];
            for (size_t k = 1; k < width; ++k) window += ' ' + words[i + k];

            size_t max_len = std::max(utf8_length(window), utf8_length(phrase));
            float dist = static_cast<float>(levenshtein(window, phrase)) / static_cast<float>(max_len);
            if (dist <= tolerance) return raw;
        }
    }
    return std::nullopt;
}

LexicalMatcher::LexicalMatcher(TranscriptionEngine engine, std::vector<std::string> phrases, Params params)
    : engine_(std::move(engine)), phrases_(std::move(phrases)), params_(params) {
    for (const auto& p : phrases_) {
        if (!prompt_.empty()) prompt_ += ". ";
        prompt_ += p;
    }
    prompt_ += '.';
}

std::optional<WakeDetection> LexicalMatcher::process(std::span<const float> samples) {
    auto min_samples = static_cast<size_t>(params_.min_audio_s * static_cast<float>(params_.capture_rate));
    if (samples.size() < min_samples) return std::nullopt;
    if (vad::rms(samples) < params_.level_gate) return std::nullopt;

    auto pcm = resample::convert(samples, params_.capture_rate, params_.model_rate);
    auto text = engine_.transcribe_with_prompt(pcm, prompt_);
    if (!text) {
        std::println(stderr, "wakeword: {}", text.error());
        return std::nullopt;
    }

    auto match = find_phrase(*text, phrases_, params_.tolerance);
    if (!match) return std::nullopt;
    return WakeDetection{.name = *match, .score = 1.0f, .avg_score = 1.0f, .hits = 1};
}
