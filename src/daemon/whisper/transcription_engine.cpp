#include "whisper/transcription_engine.hpp"

#include "whisper/preprocess.hpp"

#include <chrono>
#include <print>

TranscriptionEngine::TranscriptionEngine(std::shared_ptr<const SpeechModel> model,
                                         std::string language, bool verbose)
    : model_(std::move(model)), language_(std::move(language)), verbose_(verbose) {}

std::expected<TranscriptResult, std::string>
TranscriptionEngine::transcribe(const TranscriptionRequest& req) const {
    std::vector<float> audio = req.samples;
    preprocess::normalize_peak(audio);
    auto speech = preprocess::trim_silence(audio, kSampleRate);

    TranscriptResult result;
    result.duration_s = static_cast<double>(req.samples.size()) / kSampleRate;
    if (speech.empty()) return result;

    DecodeOptions opts{
        .language = req.language.empty() ? language_ : req.language,
        .strategy = req.strategy,
        .prompt = req.prompt,
    };

    auto t0 = std::chrono::steady_clock::now();
    auto text = model_->decode(speech, opts);
    result.processing_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    if (!text) {
        return std::unexpected("decode: " + text.error());
    }
    result.text = std::move(*text);

    if (verbose_) {
        std::println(stderr, "[kiri] decoded {:.1f}s audio in {:.2f}s ({} chars)",
                     result.duration_s, result.processing_s, result.text.size());
    }
    return result;
}

std::expected<std::string, std::string>
TranscriptionEngine::transcribe_fast(std::span<const float> pcm_16k) const {
    return run(pcm_16k, DecodeStrategy::Fast, {});
}

std::expected<std::string, std::string>
TranscriptionEngine::transcribe_accurate(std::span<const float> pcm_16k) const {
    return run(pcm_16k, DecodeStrategy::Accurate, {});
}

std::expected<std::string, std::string>
TranscriptionEngine::transcribe_with_prompt(std::span<const float> pcm_16k,
                                            const std::string& prompt) const {
    return run(pcm_16k, DecodeStrategy::Prompted, prompt);
}

std::expected<std::string, std::string>
TranscriptionEngine::run(std::span<const float> pcm_16k, DecodeStrategy strategy,
                         const std::string& prompt) const {
    TranscriptionRequest req{
        .samples = {pcm_16k.begin(), pcm_16k.end()},
        .language = language_,
        .strategy = strategy,
        .prompt = prompt,
    };
    auto res = transcribe(req);
    if (!res) return std::unexpected(res.error());
    return std::move(res->text);
}
