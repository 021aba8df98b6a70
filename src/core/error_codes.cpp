#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace ScribeErrors {

static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // Audio capture / processing
    {ErrorCode::AUDIO_INVALID_SAMPLE_RATE, "AUDIO_INVALID_SAMPLE_RATE"},
    {ErrorCode::AUDIO_INVALID_CHANNELS, "AUDIO_INVALID_CHANNELS"},
    {ErrorCode::AUDIO_UNSUPPORTED_FORMAT, "AUDIO_UNSUPPORTED_FORMAT"},
    {ErrorCode::AUDIO_CAPTURE_OVERFLOW, "AUDIO_CAPTURE_OVERFLOW"},
    {ErrorCode::AUDIO_XRUN_DETECTED, "AUDIO_XRUN_DETECTED"},
    {ErrorCode::AUDIO_DEVICE_OPEN_FAILED, "AUDIO_DEVICE_OPEN_FAILED"},
    {ErrorCode::AUDIO_SOURCE_STALLED, "AUDIO_SOURCE_STALLED"},
    {ErrorCode::AUDIO_FILE_READ_FAILED, "AUDIO_FILE_READ_FAILED"},

    // Transcription
    {ErrorCode::TRANSCRIPTION_BACKEND_UNAVAILABLE, "TRANSCRIPTION_BACKEND_UNAVAILABLE"},
    {ErrorCode::TRANSCRIPTION_MODEL_NOT_FOUND, "TRANSCRIPTION_MODEL_NOT_FOUND"},
    {ErrorCode::TRANSCRIPTION_FAILED, "TRANSCRIPTION_FAILED"},
    {ErrorCode::TRANSCRIPTION_EMPTY_AUDIO, "TRANSCRIPTION_EMPTY_AUDIO"},

    // IPC/ZeroMQ
    {ErrorCode::IPC_CONNECTION_FAILED, "IPC_CONNECTION_FAILED"},
    {ErrorCode::IPC_TIMEOUT, "IPC_TIMEOUT"},
    {ErrorCode::IPC_INVALID_COMMAND, "IPC_INVALID_COMMAND"},
    {ErrorCode::IPC_INVALID_PARAMS, "IPC_INVALID_PARAMS"},
    {ErrorCode::IPC_DAEMON_NOT_RUNNING, "IPC_DAEMON_NOT_RUNNING"},
    {ErrorCode::IPC_PROTOCOL_ERROR, "IPC_PROTOCOL_ERROR"},

    // Validation
    {ErrorCode::VALIDATION_INVALID_CONFIG, "VALIDATION_INVALID_CONFIG"},
    {ErrorCode::VALIDATION_FILE_NOT_FOUND, "VALIDATION_FILE_NOT_FOUND"},
    {ErrorCode::VALIDATION_EMPTY_CONTENT, "VALIDATION_EMPTY_CONTENT"},
    {ErrorCode::VALIDATION_INVALID_TRANSCRIPT, "VALIDATION_INVALID_TRANSCRIPT"},

    // Internal
    {ErrorCode::INTERNAL_RESOURCE_EXHAUSTED, "INTERNAL_RESOURCE_EXHAUSTED"},
    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isAudioError(code)) {
        return "audio";
    }
    if (isTranscriptionError(code)) {
        return "transcription";
    }
    if (isIpcError(code)) {
        return "ipc_zeromq";
    }
    if (isValidationError(code)) {
        return "validation";
    }
    return "internal";
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    for (const auto& entry : kErrorCodeStrings) {
        if (str == entry.second) {
            return entry.first;
        }
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

}  // namespace ScribeErrors
