#include "whisper_model.hpp"

#include <filesystem>
#include <format>
#include <whisper.h>

namespace {

struct StateDeleter {
    void operator()(whisper_state* s) const { whisper_free_state(s); }
};

} // namespace

WhisperModel::WhisperModel(whisper_context* ctx, std::string path, int threads)
    : ctx_(ctx), path_(std::move(path)), threads_(threads) {}

WhisperModel::~WhisperModel() {
    if (ctx_) whisper_free(ctx_);
}

std::expected<std::unique_ptr<WhisperModel>, std::string>
WhisperModel::load(const std::string& path, int threads) {
    if (!std::filesystem::exists(path)) {
        return std::unexpected("model file not found: " + path);
    }

    whisper_context_params cparams = whisper_context_default_params();
    whisper_context* ctx = whisper_init_from_file_with_params(path.c_str(), cparams);
    if (!ctx) {
        return std::unexpected("failed to load whisper model: " + path);
    }

    return std::unique_ptr<WhisperModel>(new WhisperModel(ctx, path, threads));
}

std::expected<std::string, std::string>
WhisperModel::decode(std::span<const float> pcm_16k, const DecodeOptions& opts) const {
    std::unique_ptr<whisper_state, StateDeleter> state(whisper_init_state(ctx_));
    if (!state) {
        return std::unexpected("failed to create whisper state");
    }

    whisper_full_params params;
    if (opts.strategy == DecodeStrategy::Accurate) {
        params = whisper_full_default_params(WHISPER_SAMPLING_BEAM_SEARCH);
        params.beam_search.beam_size = 5;
        params.beam_search.patience = 1.0f;
    } else {
        params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.greedy.best_of = 1;
    }

    params.n_threads = threads_;
    params.language = opts.language.c_str();
    params.translate = false;
    if (opts.strategy == DecodeStrategy::Prompted && !opts.prompt.empty()) {
        params.initial_prompt = opts.prompt.c_str();
    }
    params.print_special = false;
    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.single_segment = false;
    params.suppress_blank = true;
    params.suppress_nst = true;

    int rc = whisper_full_with_state(ctx_, state.get(), params,
                                     pcm_16k.data(), static_cast<int>(pcm_16k.size()));
    if (rc != 0) {
        return std::unexpected(std::format("whisper_full failed ({})", rc));
    }

    std::string text;
    const int n_segments = whisper_full_n_segments_from_state(state.get());
    for (int i = 0; i < n_segments; ++i) {
        std::string seg = whisper_full_get_segment_text_from_state(state.get(), i);
        auto b = seg.find_first_not_of(" \t\n\r");
        if (b == std::string::npos) continue;
        auto e = seg.find_last_not_of(" \t\n\r");
        if (!text.empty()) text += ' ';
        text += seg.substr(b, e - b + 1);
    }
    return text;
}
