#pragma once

#include "core/config_loader.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace transcription {

enum class TranscriptionStatus {
    Ok,
    Unsupported,
    InvalidConfig,
    Error,
};

struct TranscriptionResult {
    TranscriptionStatus status = TranscriptionStatus::Error;
    std::string text;
    std::string message;

    bool ok() const {
        return status == TranscriptionStatus::Ok;
    }
};

const char* statusToString(TranscriptionStatus status);

// Speech-to-text engine seen by one transcription worker. Each session start
// creates fresh instances, and windows are transcribed without carried context.
// Instances are not required to be thread-safe; the worker never calls
// transcribe() concurrently on the same instance.
class TranscriptionBackend {
   public:
    virtual ~TranscriptionBackend() = default;

    virtual const char* name() const = 0;

    // Input rate expected by transcribe() (mono).
    virtual uint32_t expectedSampleRate() const = 0;

    // Transcribe one window. Blocks until the engine returns.
    virtual TranscriptionResult transcribe(const std::vector<float>& samples) = 0;
};

// "whisper" needs a build with LIVE_SCRIBE_ENABLE_WHISPER; otherwise every call
// reports Unsupported. "none" accepts audio and returns empty text.
std::unique_ptr<TranscriptionBackend> createTranscriptionBackend(
    const AppConfig::TranscriptionConfig& config);

// Removes leading/trailing whitespace (space, tab, CR, LF)
std::string trimWhitespace(const std::string& text);

}  // namespace transcription
