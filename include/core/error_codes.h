#ifndef LIVE_SCRIBE_ERROR_CODES_H
#define LIVE_SCRIBE_ERROR_CODES_H

#include <cstdint>
#include <string>

namespace ScribeErrors {

/**
 * @brief Error codes used in logs and control-plane replies.
 *
 * Categories use the upper bits (0xF000 mask):
 * - 0x1xxx: Audio capture / processing
 * - 0x2xxx: Transcription
 * - 0x3xxx: IPC/ZeroMQ
 * - 0x5xxx: Validation
 * - 0xFxxx: Internal
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Audio capture / processing (0x1000)
    AUDIO_INVALID_SAMPLE_RATE = 0x1001,
    AUDIO_INVALID_CHANNELS = 0x1002,
    AUDIO_UNSUPPORTED_FORMAT = 0x1003,
    AUDIO_CAPTURE_OVERFLOW = 0x1004,
    AUDIO_XRUN_DETECTED = 0x1005,
    AUDIO_DEVICE_OPEN_FAILED = 0x1006,
    AUDIO_SOURCE_STALLED = 0x1007,
    AUDIO_FILE_READ_FAILED = 0x1008,

    // Transcription (0x2000)
    TRANSCRIPTION_BACKEND_UNAVAILABLE = 0x2001,
    TRANSCRIPTION_MODEL_NOT_FOUND = 0x2002,
    TRANSCRIPTION_FAILED = 0x2003,
    TRANSCRIPTION_EMPTY_AUDIO = 0x2004,

    // IPC/ZeroMQ (0x3000)
    IPC_CONNECTION_FAILED = 0x3001,
    IPC_TIMEOUT = 0x3002,
    IPC_INVALID_COMMAND = 0x3003,
    IPC_INVALID_PARAMS = 0x3004,
    IPC_DAEMON_NOT_RUNNING = 0x3005,
    IPC_PROTOCOL_ERROR = 0x3006,

    // Validation (0x5000)
    VALIDATION_INVALID_CONFIG = 0x5001,
    VALIDATION_FILE_NOT_FOUND = 0x5002,
    VALIDATION_EMPTY_CONTENT = 0x5003,
    VALIDATION_INVALID_TRANSCRIPT = 0x5004,

    // Internal (0xF000)
    INTERNAL_RESOURCE_EXHAUSTED = 0xF001,
    INTERNAL_UNKNOWN = 0xF002,
};

/**
 * @brief Name of the code (e.g. "TRANSCRIPTION_FAILED"), or "UNKNOWN_ERROR"
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Category name (e.g. "transcription"), or "internal" for unknown codes
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Hex representation (e.g. "0x2003")
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Reverse lookup; INTERNAL_UNKNOWN when not found
 */
ErrorCode stringToErrorCode(const std::string& str);

constexpr bool isAudioError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isTranscriptionError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isIpcError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

/**
 * @brief Whether a caller may retry the operation.
 *
 * Only IPC reachability errors are retryable. A failed transcription window
 * is never retried by the pipeline.
 */
constexpr bool isRetryable(ErrorCode code) {
    return code == ErrorCode::IPC_DAEMON_NOT_RUNNING || code == ErrorCode::IPC_TIMEOUT ||
           code == ErrorCode::IPC_CONNECTION_FAILED;
}

}  // namespace ScribeErrors

#endif  // LIVE_SCRIBE_ERROR_CODES_H
