/**
 * @file test_transcription_session.cpp
 * @brief Session lifecycle, windowing, error handling and dual-source tests
 */

#include "session/transcription_session.h"
#include "support/fake_backend.h"

#include <atomic>
#include <cmath>
#include <gtest/gtest.h>
#include <stdexcept>
#include <mutex>
#include <string>
#include <vector>

using session::SessionState;
using session::TranscriptionSession;
using session::TranscriptSegment;
using test_support::FakeBackendState;
using test_support::FakeTranscriptionBackend;
using transcription::TranscriptionStatus;
using AudioUtils::AudioSourceTag;

namespace {

constexpr int kRate = 16000;

std::vector<float> tone(double seconds, float amplitude = 0.5f, int rate = kRate,
                        int channels = 1) {
    const size_t frames = static_cast<size_t>(std::llround(seconds * rate));
    std::vector<float> out(frames * static_cast<size_t>(channels));
    for (size_t i = 0; i < frames; ++i) {
        float v = amplitude *
                  static_cast<float>(std::sin(2.0 * 3.14159265358979 * 440.0 * i / rate));
        for (int ch = 0; ch < channels; ++ch) {
            out[i * channels + ch] = v;
        }
    }
    return out;
}

class TranscriptionSessionTest : public ::testing::Test {
   protected:
    void SetUp() override {
        state_ = std::make_shared<FakeBackendState>();
    }

    TranscriptionSession::BackendFactory factory() {
        auto state = state_;
        return [this, state](std::optional<AudioSourceTag> stream) {
            std::lock_guard<std::mutex> lock(factoryMutex_);
            factoryCalls_.push_back(stream);
            return std::make_unique<FakeTranscriptionBackend>(state);
        };
    }

    std::unique_ptr<TranscriptionSession> makeSession(
        const AppConfig::SessionConfig& config = AppConfig::SessionConfig{},
        double maxQueuedSeconds = ScribeConstants::DEFAULT_MAX_QUEUED_SECONDS) {
        auto s = std::make_unique<TranscriptionSession>(config, factory(), maxQueuedSeconds);
        s->events().subscribe(session::SessionEventDispatcher::StatusHandler(
            [this](const session::StatusEvent& event) {
                std::lock_guard<std::mutex> lock(eventsMutex_);
                statuses_.push_back(event.message);
            }));
        s->events().subscribe(session::SessionEventDispatcher::SegmentHandler(
            [this](const TranscriptSegment& segment) {
                std::lock_guard<std::mutex> lock(eventsMutex_);
                published_.push_back(segment);
            }));
        return s;
    }

    bool sawStatus(const std::string& message) {
        std::lock_guard<std::mutex> lock(eventsMutex_);
        for (const auto& s : statuses_) {
            if (s == message) {
                return true;
            }
        }
        return false;
    }

    std::shared_ptr<FakeBackendState> state_;
    std::mutex factoryMutex_;
    std::vector<std::optional<AudioSourceTag>> factoryCalls_;
    std::mutex eventsMutex_;
    std::vector<std::string> statuses_;
    std::vector<TranscriptSegment> published_;
};

}  // namespace

// ============================================================
// Lifecycle
// ============================================================

TEST_F(TranscriptionSessionTest, StopRightAfterStartIsEmpty) {
    auto s = makeSession();
    ASSERT_TRUE(s->start());
    EXPECT_EQ(s->state(), SessionState::Recording);

    auto segments = s->stop();
    EXPECT_TRUE(segments.empty());
    EXPECT_EQ(s->state(), SessionState::Idle);
    EXPECT_EQ(state_->calls.load(), 0);
    EXPECT_EQ(s->lastStatus(), session::status::kComplete);
}

TEST_F(TranscriptionSessionTest, SevenSecondToneYieldsTwoOverlappingSegments) {
    auto s = makeSession();
    ASSERT_TRUE(s->start());
    ASSERT_TRUE(s->feed(AudioSourceTag::Microphone, tone(7.0)));

    auto segments = s->stop();
    ASSERT_EQ(segments.size(), 2u);
    EXPECT_DOUBLE_EQ(segments[0].startTime, 0.0);
    EXPECT_DOUBLE_EQ(segments[0].endTime, 5.0);
    EXPECT_DOUBLE_EQ(segments[1].startTime, 4.0);
    EXPECT_DOUBLE_EQ(segments[1].endTime, 7.0);
    EXPECT_EQ(segments[0].text, "segment 1");
    EXPECT_EQ(segments[1].text, "segment 2");
    ASSERT_TRUE(segments[0].source.has_value());
    EXPECT_EQ(*segments[0].source, AudioSourceTag::Microphone);

    auto sizes = state_->sizes();
    ASSERT_EQ(sizes.size(), 2u);
    EXPECT_EQ(sizes[0], 80000u);
    EXPECT_EQ(sizes[1], 48000u);

    EXPECT_EQ(s->fullTranscript(), "segment 1 segment 2");
    EXPECT_EQ(s->timestampedTranscript(), "[00:00] segment 1\n[00:04] segment 2");
}

TEST_F(TranscriptionSessionTest, CaptureFormatIsConvertedTo16kMono) {
    auto s = makeSession();
    ASSERT_TRUE(s->start());

    // 48 kHz stereo in 20 ms periods (960 frames -> 320 samples at 16 kHz)
    const auto pcm = tone(7.0, 0.5f, 48000, 2);
    const AudioUtils::AudioFormat format{48000, 2};
    const size_t period = 960;
    for (size_t frame = 0; frame < pcm.size() / 2; frame += period) {
        ASSERT_TRUE(s->feed(AudioSourceTag::Microphone, pcm.data() + frame * 2, period, format));
    }

    auto segments = s->stop();
    ASSERT_EQ(segments.size(), 2u);
    EXPECT_DOUBLE_EQ(segments[0].endTime, 5.0);
    EXPECT_DOUBLE_EQ(segments[1].startTime, 4.0);
    EXPECT_DOUBLE_EQ(segments[1].endTime, 7.0);
    EXPECT_EQ(s->stats().samplesProcessed, 112000u);
}

TEST_F(TranscriptionSessionTest, WindowsAreNormalizedBeforeTranscription) {
    auto s = makeSession();
    ASSERT_TRUE(s->start());
    s->feed(AudioSourceTag::Microphone, tone(5.0, 0.05f));
    s->stop();

    auto peaks = state_->peaks();
    ASSERT_FALSE(peaks.empty());
    for (float peak : peaks) {
        EXPECT_NEAR(peak, 0.9f, 1e-3f);
    }
}

TEST_F(TranscriptionSessionTest, SilenceCutsWindowEarly) {
    auto s = makeSession();
    ASSERT_TRUE(s->start());
    // The windower sees silenceSeconds-sized blocks: one block of tone, one of silence
    s->feed(AudioSourceTag::Microphone, tone(2.0));
    s->feed(AudioSourceTag::Microphone, std::vector<float>(2 * kRate, 0.0f));

    // The cut happens while recording, before stop() flushes anything
    ASSERT_TRUE(test_support::waitFor([&]() { return s->segments().size() == 1; }));
    auto segments = s->stop();
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_DOUBLE_EQ(segments[0].startTime, 0.0);
    EXPECT_DOUBLE_EQ(segments[0].endTime, 4.0);
}

TEST_F(TranscriptionSessionTest, SessionCanBeRestarted) {
    auto s = makeSession();
    ASSERT_TRUE(s->start());
    s->feed(AudioSourceTag::Microphone, tone(7.0));
    EXPECT_EQ(s->stop().size(), 2u);

    ASSERT_TRUE(s->start());
    EXPECT_TRUE(s->segments().empty());
    s->feed(AudioSourceTag::Microphone, tone(3.0));
    auto segments = s->stop();
    ASSERT_EQ(segments.size(), 1u);
    // Time restarts with the session
    EXPECT_DOUBLE_EQ(segments[0].startTime, 0.0);
    EXPECT_DOUBLE_EQ(segments[0].endTime, 3.0);
}

// ============================================================
// Misuse
// ============================================================

TEST_F(TranscriptionSessionTest, BoundaryMisuseIsNoOp) {
    auto s = makeSession();
    EXPECT_TRUE(s->stop().empty());
    EXPECT_FALSE(s->feed(AudioSourceTag::Microphone, tone(1.0)));

    ASSERT_TRUE(s->start());
    EXPECT_FALSE(s->start());
    EXPECT_EQ(s->state(), SessionState::Recording);
    s->stop();
    EXPECT_TRUE(s->stop().empty());
    EXPECT_EQ(s->state(), SessionState::Idle);
}

TEST_F(TranscriptionSessionTest, StartFailsWithoutBackend) {
    TranscriptionSession s(AppConfig::SessionConfig{},
                           [](std::optional<AudioSourceTag>) {
                               return std::unique_ptr<transcription::TranscriptionBackend>();
                           });
    EXPECT_FALSE(s.start());
    EXPECT_EQ(s.state(), SessionState::Idle);
}

TEST_F(TranscriptionSessionTest, RejectsUnselectedSourceAndBadFormat) {
    auto s = makeSession();
    ASSERT_TRUE(s->start());
    EXPECT_FALSE(s->acceptsSource(AudioSourceTag::SystemAudio));
    EXPECT_FALSE(s->feed(AudioSourceTag::SystemAudio, tone(1.0)));

    std::vector<float> pcm(960 * 2, 0.1f);
    EXPECT_FALSE(s->feed(AudioSourceTag::Microphone, pcm.data(), 960, {0, 2}));
    EXPECT_FALSE(s->feed(AudioSourceTag::Microphone, pcm.data(), 960, {48000, 0}));
    EXPECT_FALSE(s->feed(AudioSourceTag::Microphone, pcm.data(), 0, {48000, 2}));
    EXPECT_FALSE(s->feed(AudioSourceTag::Microphone, std::vector<float>{}));
    s->stop();
}

TEST_F(TranscriptionSessionTest, OversizedBufferIsDroppedAndCounted) {
    auto s = makeSession(AppConfig::SessionConfig{}, 0.5);
    ASSERT_TRUE(s->start());
    EXPECT_FALSE(s->feed(AudioSourceTag::Microphone, tone(1.0)));
    EXPECT_TRUE(s->feed(AudioSourceTag::Microphone, tone(0.25)));
    s->stop();

    auto stats = s->stats();
    EXPECT_EQ(stats.buffersDropped, 1u);
    EXPECT_EQ(stats.buffersAccepted, 1u);
}

// ============================================================
// Transcription results
// ============================================================

TEST_F(TranscriptionSessionTest, TranscriptionErrorIsReportedAndPipelineContinues) {
    state_->pushResult(TranscriptionStatus::Error, "", "model crashed");
    auto s = makeSession();
    ASSERT_TRUE(s->start());
    s->feed(AudioSourceTag::Microphone, tone(7.0));
    auto segments = s->stop();

    ASSERT_EQ(segments.size(), 1u);
    EXPECT_DOUBLE_EQ(segments[0].startTime, 4.0);
    EXPECT_TRUE(sawStatus("Transcription error: model crashed"));

    auto stats = s->stats();
    EXPECT_EQ(stats.windowsEmitted, 2u);
    EXPECT_EQ(stats.windowsFailed, 1u);
    EXPECT_EQ(stats.windowsTranscribed, 1u);
}

TEST_F(TranscriptionSessionTest, WhitespaceResultIsDiscarded) {
    state_->pushResult(TranscriptionStatus::Ok, "   \n");
    state_->pushResult(TranscriptionStatus::Ok, "  hello there ");
    auto s = makeSession();
    ASSERT_TRUE(s->start());
    s->feed(AudioSourceTag::Microphone, tone(7.0));
    auto segments = s->stop();

    ASSERT_EQ(segments.size(), 1u);
    EXPECT_EQ(segments[0].text, "hello there");
    EXPECT_DOUBLE_EQ(segments[0].startTime, 4.0);
    EXPECT_EQ(s->stats().emptyResults, 1u);
}

TEST_F(TranscriptionSessionTest, StatusSequenceEndsWithComplete) {
    auto s = makeSession();
    ASSERT_TRUE(s->start());
    s->feed(AudioSourceTag::Microphone, tone(6.0));
    s->stop();

    EXPECT_TRUE(sawStatus(session::status::kRecording));
    EXPECT_TRUE(sawStatus(session::status::kTranscribing));
    std::lock_guard<std::mutex> lock(eventsMutex_);
    ASSERT_FALSE(statuses_.empty());
    EXPECT_EQ(statuses_.back(), session::status::kComplete);
}

TEST_F(TranscriptionSessionTest, SegmentsAreOrderedAndPublishedInAppendOrder) {
    auto s = makeSession();
    ASSERT_TRUE(s->start());
    // Uneven feed sizes, tone interrupted by silence
    for (int i = 0; i < 6; ++i) {
        s->feed(AudioSourceTag::Microphone, tone(0.3 + 0.7 * i));
        s->feed(AudioSourceTag::Microphone, std::vector<float>(static_cast<size_t>(kRate * (i % 3)), 0.0f));
    }
    auto segments = s->stop();

    ASSERT_GE(segments.size(), 2u);
    for (size_t i = 1; i < segments.size(); ++i) {
        EXPECT_LE(segments[i - 1].startTime, segments[i].startTime) << "segment " << i;
    }

    std::lock_guard<std::mutex> lock(eventsMutex_);
    ASSERT_EQ(published_.size(), segments.size());
    for (size_t i = 0; i < segments.size(); ++i) {
        EXPECT_EQ(published_[i].text, segments[i].text);
    }
    EXPECT_EQ(state_->maxInFlight.load(), 1);
}

TEST_F(TranscriptionSessionTest, SlowRecognizerNeverRunsConcurrently) {
    state_->closeGate();
    auto s = makeSession();
    ASSERT_TRUE(s->start());
    s->feed(AudioSourceTag::Microphone, tone(14.0));

    ASSERT_TRUE(test_support::waitFor([&]() { return state_->calls.load() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(state_->calls.load(), 1);

    state_->openGate();
    auto segments = s->stop();
    EXPECT_EQ(segments.size(), 4u);
    EXPECT_EQ(state_->maxInFlight.load(), 1);
}

TEST_F(TranscriptionSessionTest, ThrowingSubscriberDoesNotStopTheSession) {
    TranscriptionSession s(AppConfig::SessionConfig{}, factory());
    std::atomic<int> attempts{0};
    std::vector<TranscriptSegment> delivered;
    std::mutex deliveredMutex;
    // Subscribed first so the collecting handler behind it must still run
    s.events().subscribe(session::SessionEventDispatcher::SegmentHandler(
        [&attempts](const TranscriptSegment&) {
            ++attempts;
            throw std::runtime_error("[json.exception.type_error.316] invalid UTF-8 byte");
        }));
    s.events().subscribe(session::SessionEventDispatcher::SegmentHandler(
        [&](const TranscriptSegment& segment) {
            std::lock_guard<std::mutex> lock(deliveredMutex);
            delivered.push_back(segment);
        }));
    s.events().subscribe(session::SessionEventDispatcher::StatusHandler(
        [](const session::StatusEvent&) { throw std::runtime_error("status sink down"); }));

    ASSERT_TRUE(s.start());
    ASSERT_TRUE(s.feed(AudioSourceTag::Microphone, std::vector<float>(6 * kRate, 0.5f)));
    auto segments = s.stop();

    ASSERT_EQ(segments.size(), 2u);
    EXPECT_DOUBLE_EQ(segments[0].startTime, 0.0);
    EXPECT_DOUBLE_EQ(segments[1].startTime, 4.0);
    EXPECT_DOUBLE_EQ(segments[1].endTime, 6.0);
    EXPECT_EQ(attempts.load(), 2);
    std::lock_guard<std::mutex> lock(deliveredMutex);
    EXPECT_EQ(delivered.size(), 2u);
    EXPECT_EQ(s.state(), SessionState::Idle);
    EXPECT_FALSE(s.stats().aborted);
}

// ============================================================
// Pipeline failure
// ============================================================

TEST_F(TranscriptionSessionTest, PipelineFailureFinalizesOnItsOwn) {
    auto s = makeSession();
    s->setWindowObserver([](const AudioUtils::AudioWindow& window) {
        if (window.startTime == 4.0) {
            throw std::runtime_error("out of window buffers");
        }
    });
    ASSERT_TRUE(s->start());
    ASSERT_TRUE(s->feed(AudioSourceTag::Microphone, tone(7.0)));
    ASSERT_TRUE(s->feed(AudioSourceTag::Microphone, tone(6.0)));

    ASSERT_TRUE(test_support::waitFor([&]() { return s->state() == SessionState::Idle; }));
    const std::string aborted = std::string(session::status::kAbortedPrefix) + "out of window buffers";
    EXPECT_TRUE(sawStatus(aborted));
    EXPECT_EQ(s->lastStatus(), aborted);
    EXPECT_FALSE(sawStatus(session::status::kComplete));
    EXPECT_TRUE(s->stats().aborted);
    EXPECT_FALSE(s->feed(AudioSourceTag::Microphone, tone(1.0)));

    // The failed window (4, 9) is lost; audio still buffered is flushed
    auto segments = s->segments();
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_DOUBLE_EQ(segments[0].startTime, 0.0);
    EXPECT_DOUBLE_EQ(segments[1].startTime, 8.0);
    EXPECT_DOUBLE_EQ(segments[1].endTime, 13.0);
    EXPECT_DOUBLE_EQ(segments[2].startTime, 12.0);
    EXPECT_DOUBLE_EQ(segments[2].endTime, 13.0);
    {
        std::lock_guard<std::mutex> lock(eventsMutex_);
        EXPECT_EQ(published_.size(), 3u);
    }

    // Already finalized
    EXPECT_TRUE(s->stop().empty());
    EXPECT_EQ(s->segments().size(), 3u);

    ASSERT_TRUE(s->start());
    EXPECT_FALSE(s->stats().aborted);
    EXPECT_TRUE(s->segments().empty());
    s->stop();
}

TEST_F(TranscriptionSessionTest, FailureDuringFinalFlushStillEndsIdle) {
    auto s = makeSession();
    s->setWindowObserver([](const AudioUtils::AudioWindow&) {
        throw std::runtime_error("disk full");
    });
    ASSERT_TRUE(s->start());
    ASSERT_TRUE(s->feed(AudioSourceTag::Microphone, tone(3.0)));

    auto segments = s->stop();
    EXPECT_TRUE(segments.empty());
    EXPECT_EQ(s->state(), SessionState::Idle);
    EXPECT_TRUE(s->stats().aborted);
    EXPECT_TRUE(sawStatus(std::string(session::status::kAbortedPrefix) + "disk full"));
    EXPECT_FALSE(sawStatus(session::status::kComplete));
    EXPECT_EQ(state_->calls.load(), 0);
}

TEST_F(TranscriptionSessionTest, WindowObserverIsFixedWhileRecording) {
    auto s = makeSession();
    std::atomic<int> seen{0};
    s->setWindowObserver([&seen](const AudioUtils::AudioWindow&) { ++seen; });
    ASSERT_TRUE(s->start());
    s->setWindowObserver([](const AudioUtils::AudioWindow&) {
        throw std::runtime_error("must not be installed");
    });
    s->feed(AudioSourceTag::Microphone, tone(7.0));
    EXPECT_EQ(s->stop().size(), 2u);
    EXPECT_EQ(seen.load(), 2);
    EXPECT_FALSE(s->stats().aborted);
}

// ============================================================
// Dual source
// ============================================================

TEST_F(TranscriptionSessionTest, MixStrategyProducesOneUntaggedStream) {
    AppConfig::SessionConfig config;
    config.dualSource = true;
    config.dualSourceStrategy = DualSourceStrategy::Mix;
    auto s = makeSession(config);
    ASSERT_TRUE(s->start());
    EXPECT_EQ(factoryCalls_.size(), 1u);

    const auto mic = tone(7.0, 0.4f);
    const auto sys = tone(7.0, 0.3f);
    const size_t step = 8000;
    for (size_t pos = 0; pos < mic.size(); pos += step) {
        s->feed(AudioSourceTag::Microphone,
                std::vector<float>(mic.begin() + pos, mic.begin() + pos + step));
        s->feed(AudioSourceTag::SystemAudio,
                std::vector<float>(sys.begin() + pos, sys.begin() + pos + step));
    }
    auto segments = s->stop();

    ASSERT_EQ(segments.size(), 2u);
    EXPECT_FALSE(segments[0].source.has_value());
    EXPECT_DOUBLE_EQ(segments[0].startTime, 0.0);
    EXPECT_DOUBLE_EQ(segments[1].startTime, 4.0);
    EXPECT_DOUBLE_EQ(segments[1].endTime, 7.0);
    EXPECT_EQ(s->stats().zeroFilledMicrophone, 0u);
    EXPECT_EQ(s->stats().zeroFilledSystem, 0u);
}

TEST_F(TranscriptionSessionTest, MixStrategyZeroFillsSilentSource) {
    AppConfig::SessionConfig config;
    config.dualSource = true;
    config.dualSourceStrategy = DualSourceStrategy::Mix;
    auto s = makeSession(config);
    ASSERT_TRUE(s->start());
    s->feed(AudioSourceTag::Microphone, tone(7.0));
    auto segments = s->stop();

    EXPECT_EQ(segments.size(), 2u);
    EXPECT_EQ(s->stats().zeroFilledSystem, 112000u);
    EXPECT_EQ(s->stats().zeroFilledMicrophone, 0u);
}

TEST_F(TranscriptionSessionTest, IndependentStrategyMergesByCaptureTime) {
    AppConfig::SessionConfig config;
    config.dualSource = true;
    config.dualSourceStrategy = DualSourceStrategy::Independent;
    auto s = makeSession(config);
    ASSERT_TRUE(s->start());
    ASSERT_EQ(factoryCalls_.size(), 2u);
    EXPECT_TRUE(factoryCalls_[0].has_value());
    EXPECT_TRUE(factoryCalls_[1].has_value());

    s->feed(AudioSourceTag::Microphone, tone(3.0));
    s->feed(AudioSourceTag::SystemAudio, tone(6.0));
    auto segments = s->stop();

    ASSERT_EQ(segments.size(), 3u);
    int mic = 0;
    int sys = 0;
    for (size_t i = 0; i < segments.size(); ++i) {
        ASSERT_TRUE(segments[i].source.has_value());
        if (*segments[i].source == AudioSourceTag::Microphone) {
            ++mic;
        } else {
            ++sys;
        }
        if (i > 0) {
            EXPECT_LE(segments[i - 1].capturedAt, segments[i].capturedAt);
        }
    }
    EXPECT_EQ(mic, 1);
    EXPECT_EQ(sys, 2);
}

TEST_F(TranscriptionSessionTest, SingleSystemSourceIsSelectable) {
    AppConfig::SessionConfig config;
    config.singleSource = AudioSourceTag::SystemAudio;
    auto s = makeSession(config);
    ASSERT_TRUE(s->start());
    EXPECT_FALSE(s->feed(AudioSourceTag::Microphone, tone(1.0)));
    EXPECT_TRUE(s->feed(AudioSourceTag::SystemAudio, tone(3.0)));
    auto segments = s->stop();
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_EQ(*segments[0].source, AudioSourceTag::SystemAudio);
}

TEST_F(TranscriptionSessionTest, InvalidConfigFallsBackToDefaults) {
    AppConfig::SessionConfig config;
    config.chunkSeconds = -1.0;
    TranscriptionSession s(config, factory());
    EXPECT_DOUBLE_EQ(s.config().chunkSeconds, ScribeConstants::DEFAULT_CHUNK_SECONDS);
}
