#pragma once

#include "audio/audio_format.h"
#include "audio/chunk_windower.h"
#include "audio/stream_mixer.h"
#include "core/config_loader.h"
#include "session/segment_store.h"
#include "session/session_events.h"
#include "session/transcript_segment.h"
#include "transcription/transcription_backend.h"
#include "transcription/transcription_worker.h"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace session {

using AudioUtils::AudioFormat;

struct SessionStats {
    uint64_t buffersAccepted = 0;
    uint64_t buffersDropped = 0;  // capture queue overflow
    uint64_t samplesProcessed = 0;  // 16 kHz samples that reached a windower
    uint64_t windowsEmitted = 0;
    uint64_t windowsTranscribed = 0;
    uint64_t windowsFailed = 0;
    uint64_t emptyResults = 0;
    uint64_t zeroFilledMicrophone = 0;
    uint64_t zeroFilledSystem = 0;
    bool aborted = false;
};

/**
 * @brief Live transcription session: Idle -> Recording -> Finalizing -> Idle
 *
 * Capture threads call feed(), which only queues the buffer. A pipeline worker
 * converts queued buffers to 16 kHz mono in arrival order, mixes or splits the
 * sources per DualSourceStrategy, and cuts windows. Each stream then has its
 * own TranscriptionWorker, so calls are serialized per stream while the
 * microphone and system streams may run concurrently.
 *
 * stop() drains the capture queue, flushes the mixer and every windower, waits
 * for all transcription calls to finish and returns the ordered segments.
 * Boundary misuse (start while recording, stop while idle) is a no-op.
 *
 * If the pipeline worker fails (allocation failure, a throwing window
 * observer) the session finalizes itself: audio already cut or staged is
 * flushed on a best-effort basis, the workers drain, "Session aborted: <what>"
 * is published and the state returns to Idle. The segments stay readable
 * through segments() until the next start(); a later stop() is a no-op.
 */
class TranscriptionSession {
   public:
    // Called once per stream on start(); stream is empty for the mixed stream.
    using BackendFactory = std::function<std::unique_ptr<transcription::TranscriptionBackend>(
        std::optional<AudioSourceTag> stream)>;

    // Sees each normalized window on the pipeline thread, before it is queued
    // for transcription. An exception thrown here aborts the session.
    using WindowObserver = std::function<void(const AudioUtils::AudioWindow&)>;

    TranscriptionSession(const AppConfig::SessionConfig& config, BackendFactory factory,
                         double maxQueuedSeconds = ScribeConstants::DEFAULT_MAX_QUEUED_SECONDS);
    ~TranscriptionSession();

    TranscriptionSession(const TranscriptionSession&) = delete;
    TranscriptionSession& operator=(const TranscriptionSession&) = delete;

    // Returns false (and does nothing) unless Idle.
    bool start();

    // Only while Idle
    void setWindowObserver(WindowObserver observer);

    // Interleaved PCM at any rate/channel count. Safe to call from capture callbacks.
    // Returns false when the buffer was not accepted.
    bool feed(AudioSourceTag source, const float* interleaved, size_t frames,
              const AudioFormat& format);

    // Samples already at 16 kHz mono.
    bool feed(AudioSourceTag source, std::vector<float> samples16kMono);

    // Returns the finalized segments; empty when not Recording.
    std::vector<TranscriptSegment> stop();

    SessionState state() const {
        return state_.load(std::memory_order_acquire);
    }

    bool acceptsSource(AudioSourceTag source) const;

    std::vector<TranscriptSegment> segments() const;
    std::string fullTranscript() const;
    std::string timestampedTranscript() const;

    SessionStats stats() const;
    std::string lastStatus() const;

    SessionEventDispatcher& events() {
        return events_;
    }

    const AppConfig::SessionConfig& config() const {
        return config_;
    }

   private:
    struct CaptureBuffer {
        AudioSourceTag source = AudioSourceTag::Microphone;
        std::vector<float> samples;
        AudioFormat format;
        double seconds = 0.0;
    };

    // Windower, feed staging and recognizer queue for one transcribed stream
    struct Stream {
        std::optional<AudioSourceTag> tag;
        AudioUtils::ChunkWindower windower;
        std::vector<float> staging;
        std::unique_ptr<transcription::TranscriptionWorker> worker;

        Stream(std::optional<AudioSourceTag> t, const AudioUtils::WindowerConfig& cfg)
            : tag(t), windower(cfg, t) {}
    };

    bool enqueue(CaptureBuffer buffer);
    void pipelineLoop();
    void processBuffer(CaptureBuffer& buffer);
    void finalizePipeline();
    void stageSamples(Stream& stream, const std::vector<float>& samples);
    void submitWindows(Stream& stream, std::vector<AudioUtils::AudioWindow> windows);
    void abortPipeline(const char* what);
    void stopWorkers();

    Stream* streamFor(AudioSourceTag source);
    bool mixing() const;

    void onWindowBegin(const AudioUtils::AudioWindow& window);
    void onWindowResult(const AudioUtils::AudioWindow& window,
                        const transcription::TranscriptionResult& result);
    void publishStatus(const std::string& message);

    AppConfig::SessionConfig config_;
    BackendFactory factory_;
    WindowObserver windowObserver_;
    double maxQueuedSeconds_;
    size_t feedBlockSamples_;

    std::mutex controlMutex_;  // serializes start()/stop()
    std::atomic<SessionState> state_{SessionState::Idle};

    // Capture queue
    std::mutex queueMutex_;
    std::condition_variable queueCv_;
    std::deque<CaptureBuffer> queue_;
    double queuedSeconds_ = 0.0;
    bool finalizeRequested_ = false;

    // Owned by the pipeline worker while Recording
    std::thread pipelineThread_;
    std::vector<std::unique_ptr<Stream>> streams_;
    std::unique_ptr<AudioUtils::StreamMixer> mixer_;
    std::atomic<bool> aborted_{false};

    // Segments; publishMutex_ keeps subscriber delivery in append order
    std::mutex publishMutex_;
    mutable std::mutex segmentsMutex_;
    SegmentStore store_;

    mutable std::mutex statusMutex_;
    std::string lastStatus_;

    SessionEventDispatcher events_;

    std::atomic<uint64_t> buffersAccepted_{0};
    std::atomic<uint64_t> buffersDropped_{0};
    std::atomic<uint64_t> samplesProcessed_{0};
    std::atomic<uint64_t> windowsEmitted_{0};
    std::atomic<uint64_t> windowsTranscribed_{0};
    std::atomic<uint64_t> windowsFailed_{0};
    std::atomic<uint64_t> emptyResults_{0};
    std::atomic<uint64_t> zeroFilledMicrophone_{0};
    std::atomic<uint64_t> zeroFilledSystem_{0};
};

}  // namespace session
