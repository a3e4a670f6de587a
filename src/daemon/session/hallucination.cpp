#include "session/hallucination.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace {

constexpr std::array<std::string_view, 12> kPhrases = {
    "you",
    "thank you.",
    "thanks for watching!",
    "thank you for watching!",
    "subscribe",
    "like and subscribe",
    "(silence)",
    "[silence]",
    "[blank_audio]",
    "...",
    "the end.",
    "bye.",
};

std::string_view trim(std::string_view s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

} // namespace

bool is_hallucination(std::string_view text) {
    auto t = trim(text);
    if (t.size() < 2) return true;

    std::string lower(t);
    std::ranges::transform(lower, lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (std::ranges::find(kPhrases, std::string_view(lower)) != kPhrases.end()) return true;

    // Nothing but punctuation and spaces ("...", "- -", "?!")
    bool has_word_char = std::ranges::any_of(lower, [](unsigned char c) {
        return std::isalnum(c) != 0 || c >= 0x80;
    });
    if (!has_word_char) return true;

    // Fully bracketed annotations such as [Music] or (wind blowing)
    if ((lower.front() == '[' && lower.back() == ']') ||
        (lower.front() == '(' && lower.back() == ')')) {
        return true;
    }
    return false;
}
