/**
 * @file test_error_codes.cpp
 * @brief Unit tests for error code names, categories and retry policy
 */

#include "core/error_codes.h"

#include <gtest/gtest.h>

using namespace ScribeErrors;

// ============================================================
// ErrorCode to String
// ============================================================

TEST(ErrorCodes, ErrorCodeToString) {
    EXPECT_STREQ(errorCodeToString(ErrorCode::OK), "OK");
    EXPECT_STREQ(errorCodeToString(ErrorCode::AUDIO_CAPTURE_OVERFLOW), "AUDIO_CAPTURE_OVERFLOW");
    EXPECT_STREQ(errorCodeToString(ErrorCode::TRANSCRIPTION_FAILED), "TRANSCRIPTION_FAILED");
    EXPECT_STREQ(errorCodeToString(ErrorCode::IPC_TIMEOUT), "IPC_TIMEOUT");
    EXPECT_STREQ(errorCodeToString(ErrorCode::VALIDATION_INVALID_TRANSCRIPT),
                 "VALIDATION_INVALID_TRANSCRIPT");
}

TEST(ErrorCodes, UnknownErrorCodeReturnsUnknown) {
    auto unknownCode = static_cast<ErrorCode>(0xFFFF);
    EXPECT_STREQ(errorCodeToString(unknownCode), "UNKNOWN_ERROR");
}

// ============================================================
// Categories
// ============================================================

TEST(ErrorCodes, GetErrorCategory) {
    EXPECT_STREQ(getErrorCategory(ErrorCode::OK), "ok");
    EXPECT_STREQ(getErrorCategory(ErrorCode::AUDIO_DEVICE_OPEN_FAILED), "audio");
    EXPECT_STREQ(getErrorCategory(ErrorCode::TRANSCRIPTION_MODEL_NOT_FOUND), "transcription");
    EXPECT_STREQ(getErrorCategory(ErrorCode::IPC_CONNECTION_FAILED), "ipc_zeromq");
    EXPECT_STREQ(getErrorCategory(ErrorCode::VALIDATION_INVALID_CONFIG), "validation");
    EXPECT_STREQ(getErrorCategory(ErrorCode::INTERNAL_RESOURCE_EXHAUSTED), "internal");
}

TEST(ErrorCodes, UnknownCategoryReturnsInternal) {
    EXPECT_STREQ(getErrorCategory(static_cast<ErrorCode>(0x9999)), "internal");
}

TEST(ErrorCodes, CategoryCheckers) {
    EXPECT_TRUE(isAudioError(ErrorCode::AUDIO_XRUN_DETECTED));
    EXPECT_FALSE(isAudioError(ErrorCode::TRANSCRIPTION_FAILED));
    EXPECT_TRUE(isTranscriptionError(ErrorCode::TRANSCRIPTION_EMPTY_AUDIO));
    EXPECT_TRUE(isIpcError(ErrorCode::IPC_PROTOCOL_ERROR));
    EXPECT_TRUE(isValidationError(ErrorCode::VALIDATION_FILE_NOT_FOUND));
    EXPECT_TRUE(isInternalError(ErrorCode::INTERNAL_UNKNOWN));
    EXPECT_FALSE(isInternalError(ErrorCode::OK));
}

// ============================================================
// Hex / reverse lookup
// ============================================================

TEST(ErrorCodes, ErrorCodeToHex) {
    EXPECT_EQ(errorCodeToHex(ErrorCode::OK), "0x0000");
    EXPECT_EQ(errorCodeToHex(ErrorCode::AUDIO_CAPTURE_OVERFLOW), "0x1004");
    EXPECT_EQ(errorCodeToHex(ErrorCode::INTERNAL_UNKNOWN), "0xf002");
}

TEST(ErrorCodes, StringToErrorCode) {
    EXPECT_EQ(stringToErrorCode("IPC_TIMEOUT"), ErrorCode::IPC_TIMEOUT);
    EXPECT_EQ(stringToErrorCode("TRANSCRIPTION_BACKEND_UNAVAILABLE"),
              ErrorCode::TRANSCRIPTION_BACKEND_UNAVAILABLE);
    EXPECT_EQ(stringToErrorCode("NOT_A_CODE"), ErrorCode::INTERNAL_UNKNOWN);
}

// ============================================================
// Retry policy
// ============================================================

TEST(ErrorCodes, OnlyIpcReachabilityIsRetryable) {
    EXPECT_TRUE(isRetryable(ErrorCode::IPC_DAEMON_NOT_RUNNING));
    EXPECT_TRUE(isRetryable(ErrorCode::IPC_TIMEOUT));
    EXPECT_TRUE(isRetryable(ErrorCode::IPC_CONNECTION_FAILED));

    EXPECT_FALSE(isRetryable(ErrorCode::TRANSCRIPTION_FAILED));
    EXPECT_FALSE(isRetryable(ErrorCode::IPC_INVALID_COMMAND));
    EXPECT_FALSE(isRetryable(ErrorCode::AUDIO_CAPTURE_OVERFLOW));
}
