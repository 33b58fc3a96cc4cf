#include "transcriber.hpp"

#include "wav_encoder.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#if defined(BACKTRACK_WITH_VOSK)
#include <vosk_api.h>
#endif

namespace {

#if defined(BACKTRACK_WITH_VOSK)
std::string extract_text_field(const std::string& json) {
    auto pos = json.find("\"text\"");
    if (pos == std::string::npos) return {};
    pos = json.find(':', pos);
    if (pos == std::string::npos) return {};
    pos = json.find('"', pos);
    if (pos == std::string::npos) return {};
    auto end = json.find('"', pos + 1);
    if (end == std::string::npos) return {};
    return json.substr(pos + 1, end - pos - 1);
}

// Feed size per accept call, in samples.
constexpr std::size_t kFeedSamples = 4096;
#endif

} // namespace

struct Transcriber::Impl {
#if defined(BACKTRACK_WITH_VOSK)
    VoskModel* model{nullptr};

    explicit Impl(const std::string& model_path) {
        model = vosk_model_new(model_path.c_str());
        if (!model) {
            throw std::runtime_error("Failed to load Vosk model at " + model_path);
        }
    }

    ~Impl() {
        if (model) {
            vosk_model_free(model);
            model = nullptr;
        }
    }

    bool available() const { return model != nullptr; }

    std::vector<TranscriptSegment> transcribe(const std::vector<uint8_t>& wav_file) {
        DecodedWav wav = decode_wav(wav_file);

        std::unique_ptr<VoskRecognizer, void (*)(VoskRecognizer*)> recognizer(
            vosk_recognizer_new(model, static_cast<float>(wav.sample_rate)), vosk_recognizer_free);
        if (!recognizer) {
            throw std::runtime_error("Failed to create Vosk recognizer at " +
                                     std::to_string(wav.sample_rate) + " Hz");
        }
        vosk_recognizer_set_max_alternatives(recognizer.get(), 0);
        vosk_recognizer_set_partial_words(recognizer.get(), false);

        std::vector<TranscriptSegment> segments;
        auto collect = [&segments](const char* raw) {
            std::string text = extract_text_field(raw ? raw : "");
            if (!text.empty()) segments.push_back({text, "A"});
        };

        for (std::size_t offset = 0; offset < wav.samples.size(); offset += kFeedSamples) {
            std::size_t count = std::min(kFeedSamples, wav.samples.size() - offset);
            int done = vosk_recognizer_accept_waveform_s(recognizer.get(),
                                                         wav.samples.data() + offset,
                                                         static_cast<int>(count));
            if (done < 0) {
                throw std::runtime_error("Vosk rejected audio data");
            }
            if (done == 1) collect(vosk_recognizer_result(recognizer.get()));
        }
        collect(vosk_recognizer_final_result(recognizer.get()));

        return segments;
    }
#else
    explicit Impl(const std::string&) {
        throw std::runtime_error("Vosk support not enabled; rebuild with BACKTRACK_ENABLE_VOSK=ON");
    }

    bool available() const { return false; }
    std::vector<TranscriptSegment> transcribe(const std::vector<uint8_t>&) { return {}; }
#endif
};

Transcriber::Transcriber(const std::string& model_path)
    : impl_(std::make_unique<Impl>(model_path)) {}

Transcriber::~Transcriber() = default;

bool Transcriber::available() const { return impl_ && impl_->available(); }

std::vector<TranscriptSegment> Transcriber::transcribe(const std::vector<uint8_t>& wav_file) {
    if (!impl_) return {};
    return impl_->transcribe(wav_file);
}
