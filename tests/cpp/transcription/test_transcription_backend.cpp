/**
 * @file test_transcription_backend.cpp
 * @brief Unit tests for the transcription backend factory and helpers
 */

#include "transcription/transcription_backend.h"

#include <gtest/gtest.h>
#include <vector>

using transcription::TranscriptionStatus;

namespace {

AppConfig::TranscriptionConfig configFor(const std::string& backend) {
    AppConfig::TranscriptionConfig config;
    config.backend = backend;
    config.modelPath = "/nonexistent/ggml-model.bin";
    return config;
}

}  // namespace

TEST(TranscriptionBackend, NoneBackendReturnsEmptyText) {
    auto backend = transcription::createTranscriptionBackend(configFor("none"));
    ASSERT_NE(backend, nullptr);
    EXPECT_STREQ(backend->name(), "none");
    EXPECT_EQ(backend->expectedSampleRate(), 16000u);

    auto result = backend->transcribe(std::vector<float>(16000, 0.1f));
    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(result.text.empty());
}

TEST(TranscriptionBackend, EmptyWindowIsRejected) {
    auto backend = transcription::createTranscriptionBackend(configFor("none"));
    auto result = backend->transcribe({});
    EXPECT_EQ(result.status, TranscriptionStatus::InvalidConfig);
    EXPECT_FALSE(result.message.empty());
}

TEST(TranscriptionBackend, UnknownNameFallsBackToNone) {
    auto backend = transcription::createTranscriptionBackend(configFor("does-not-exist"));
    ASSERT_NE(backend, nullptr);
    EXPECT_STREQ(backend->name(), "none");
}

TEST(TranscriptionBackend, WhisperNameIsCaseInsensitive) {
    auto backend = transcription::createTranscriptionBackend(configFor("Whisper"));
    ASSERT_NE(backend, nullptr);
    EXPECT_STREQ(backend->name(), "whisper");
}

TEST(TranscriptionBackend, WhisperWithoutModelDoesNotTranscribe) {
    auto backend = transcription::createTranscriptionBackend(configFor("whisper"));
    ASSERT_NE(backend, nullptr);
    auto result = backend->transcribe(std::vector<float>(16000, 0.0f));
    EXPECT_FALSE(result.ok());
#ifdef LIVE_SCRIBE_ENABLE_WHISPER
    EXPECT_EQ(result.status, TranscriptionStatus::InvalidConfig);
#else
    EXPECT_EQ(result.status, TranscriptionStatus::Unsupported);
#endif
}

TEST(TranscriptionBackend, StatusToString) {
    EXPECT_STREQ(transcription::statusToString(TranscriptionStatus::Ok), "ok");
    EXPECT_STREQ(transcription::statusToString(TranscriptionStatus::Unsupported), "unsupported");
    EXPECT_STREQ(transcription::statusToString(TranscriptionStatus::InvalidConfig),
                 "invalid_config");
    EXPECT_STREQ(transcription::statusToString(TranscriptionStatus::Error), "error");
}

TEST(TranscriptionBackend, TrimWhitespace) {
    EXPECT_EQ(transcription::trimWhitespace("  hello world \n"), "hello world");
    EXPECT_EQ(transcription::trimWhitespace("\t\r\n "), "");
    EXPECT_EQ(transcription::trimWhitespace(""), "");
    EXPECT_EQ(transcription::trimWhitespace("x"), "x");
}
