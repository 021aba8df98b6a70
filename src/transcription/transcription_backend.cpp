#include "transcription/transcription_backend.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <utility>

#ifdef LIVE_SCRIBE_ENABLE_WHISPER
#include <whisper.h>
#endif

namespace transcription {
namespace {

constexpr uint32_t kWhisperRate = ScribeConstants::TARGET_SAMPLE_RATE;

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

class NullTranscriptionBackend final : public TranscriptionBackend {
   public:
    const char* name() const override {
        return "none";
    }

    uint32_t expectedSampleRate() const override {
        return kWhisperRate;
    }

    TranscriptionResult transcribe(const std::vector<float>& samples) override {
        if (samples.empty()) {
            return {TranscriptionStatus::InvalidConfig, "", "empty audio window"};
        }
        return {TranscriptionStatus::Ok, "", ""};
    }
};

#ifdef LIVE_SCRIBE_ENABLE_WHISPER

class WhisperTranscriptionBackend final : public TranscriptionBackend {
   public:
    explicit WhisperTranscriptionBackend(AppConfig::TranscriptionConfig config)
        : config_(std::move(config)) {
        initialize();
    }

    ~WhisperTranscriptionBackend() override {
        if (ctx_) {
            whisper_free(ctx_);
        }
    }

    WhisperTranscriptionBackend(const WhisperTranscriptionBackend&) = delete;
    WhisperTranscriptionBackend& operator=(const WhisperTranscriptionBackend&) = delete;

    const char* name() const override {
        return "whisper";
    }

    uint32_t expectedSampleRate() const override {
        return WHISPER_SAMPLE_RATE;
    }

    TranscriptionResult transcribe(const std::vector<float>& samples) override {
        if (samples.empty()) {
            return {TranscriptionStatus::InvalidConfig, "", "empty audio window"};
        }
        if (!ctx_) {
            return {TranscriptionStatus::InvalidConfig, "",
                    initError_.empty() ? "whisper context is not initialized" : initError_};
        }

        whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.print_progress = false;
        params.print_special = false;
        params.print_realtime = false;
        params.print_timestamps = false;
        params.translate = false;
        params.no_context = true;
        params.language = config_.language.empty() ? "auto" : config_.language.c_str();
        params.n_threads = std::max(1, config_.threads);

        if (whisper_full(ctx_, params, samples.data(), static_cast<int>(samples.size())) != 0) {
            return {TranscriptionStatus::Error, "", "whisper_full failed"};
        }

        std::string text;
        const int segments = whisper_full_n_segments(ctx_);
        for (int i = 0; i < segments; ++i) {
            const char* seg = whisper_full_get_segment_text(ctx_, i);
            if (seg) {
                text += seg;
            }
        }
        return {TranscriptionStatus::Ok, trimWhitespace(text), ""};
    }

   private:
    void initialize() {
        if (!std::filesystem::exists(config_.modelPath)) {
            initError_ = "whisper model not found: " + config_.modelPath;
            LOG_ERROR("Transcription: {}", initError_);
            return;
        }
        whisper_context_params cparams = whisper_context_default_params();
        ctx_ = whisper_init_from_file_with_params(config_.modelPath.c_str(), cparams);
        if (!ctx_) {
            initError_ = "failed to load whisper model: " + config_.modelPath;
            LOG_ERROR("Transcription: {}", initError_);
            return;
        }
        LOG_INFO("Transcription: whisper model loaded ({}, language={}, threads={})",
                 config_.modelPath, config_.language, config_.threads);
    }

    AppConfig::TranscriptionConfig config_;
    whisper_context* ctx_ = nullptr;
    std::string initError_;
};

#else  // LIVE_SCRIBE_ENABLE_WHISPER

class WhisperTranscriptionBackend final : public TranscriptionBackend {
   public:
    explicit WhisperTranscriptionBackend(const AppConfig::TranscriptionConfig& /*config*/) {}

    const char* name() const override {
        return "whisper";
    }

    uint32_t expectedSampleRate() const override {
        return kWhisperRate;
    }

    TranscriptionResult transcribe(const std::vector<float>& samples) override {
        if (samples.empty()) {
            return {TranscriptionStatus::InvalidConfig, "", "empty audio window"};
        }
        return {TranscriptionStatus::Unsupported, "",
                "whisper backend is not enabled at build time (rebuild with "
                "LIVE_SCRIBE_ENABLE_WHISPER=ON)"};
    }
};

#endif  // LIVE_SCRIBE_ENABLE_WHISPER

}  // namespace

const char* statusToString(TranscriptionStatus status) {
    switch (status) {
    case TranscriptionStatus::Ok:
        return "ok";
    case TranscriptionStatus::Unsupported:
        return "unsupported";
    case TranscriptionStatus::InvalidConfig:
        return "invalid_config";
    case TranscriptionStatus::Error:
        return "error";
    }
    return "error";
}

std::string trimWhitespace(const std::string& text) {
    const char* ws = " \t\r\n";
    auto first = text.find_first_not_of(ws);
    if (first == std::string::npos) {
        return "";
    }
    auto last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

std::unique_ptr<TranscriptionBackend> createTranscriptionBackend(
    const AppConfig::TranscriptionConfig& config) {
    std::string backend = toLower(config.backend);

    if (backend == "none" || backend == "null") {
        return std::make_unique<NullTranscriptionBackend>();
    }

    if (backend == "whisper" || backend == "whisper.cpp") {
        return std::make_unique<WhisperTranscriptionBackend>(config);
    }

    LOG_WARN("Transcription: Unknown backend '{}' (falling back to none)", config.backend);
    return std::make_unique<NullTranscriptionBackend>();
}

}  // namespace transcription
