#pragma once

#include "audio/audio_format.h"

#include <chrono>
#include <optional>
#include <string>

namespace session {

using AudioUtils::AudioSourceTag;

// One unit of transcribed text. startTime/endTime are seconds since session
// start, derived from processed sample counts.
struct TranscriptSegment {
    std::string text;
    double startTime = 0.0;
    double endTime = 0.0;
    std::chrono::system_clock::time_point capturedAt{};
    std::optional<AudioSourceTag> source;  // empty for the mixed stream
    std::optional<std::string> speakerLabel;

    double duration() const {
        return endTime - startTime;
    }
};

enum class SessionState { Idle, Recording, Finalizing };

inline const char* sessionStateToString(SessionState state) {
    switch (state) {
    case SessionState::Idle:
        return "idle";
    case SessionState::Recording:
        return "recording";
    case SessionState::Finalizing:
        return "finalizing";
    }
    return "unknown";
}

// Status strings published on the subscriber channel
namespace status {
constexpr const char* kRecording = "Recording";
constexpr const char* kTranscribing = "Transcribing...";
constexpr const char* kComplete = "Transcription complete";
constexpr const char* kErrorPrefix = "Transcription error: ";
constexpr const char* kAbortedPrefix = "Session aborted: ";
}  // namespace status

}  // namespace session
