#pragma once

#include "audio/chunk_windower.h"
#include "transcription/transcription_backend.h"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace transcription {

// Serializes recognizer calls for one stream.
//
// Windows are queued FIFO and handed to the backend one at a time on the
// worker's own thread; a window submitted while a call is in flight waits,
// it is never dropped or run in parallel. There is no per-call timeout.
class TranscriptionWorker {
   public:
    using BeginHandler = std::function<void(const AudioUtils::AudioWindow&)>;
    using ResultHandler =
        std::function<void(const AudioUtils::AudioWindow&, const TranscriptionResult&)>;

    TranscriptionWorker(std::string name, std::unique_ptr<TranscriptionBackend> backend,
                        BeginHandler onBegin, ResultHandler onResult);
    ~TranscriptionWorker();

    TranscriptionWorker(const TranscriptionWorker&) = delete;
    TranscriptionWorker& operator=(const TranscriptionWorker&) = delete;

    void start();

    // Queues a window. Returns false once stop() has begun.
    bool submit(AudioUtils::AudioWindow window);

    // Blocks until every queued window has been transcribed.
    void drain();

    // drain(), then joins the thread. Idempotent.
    void stop();

    size_t pending() const;
    uint64_t completed() const {
        return completed_.load(std::memory_order_relaxed);
    }
    const std::string& name() const {
        return name_;
    }
    const TranscriptionBackend* backend() const {
        return backend_.get();
    }

   private:
    void workerLoop();
    TranscriptionResult runBackend(const AudioUtils::AudioWindow& window);

    std::string name_;
    std::unique_ptr<TranscriptionBackend> backend_;
    BeginHandler onBegin_;
    ResultHandler onResult_;

    mutable std::mutex mutex_;
    std::condition_variable queueCv_;
    std::condition_variable idleCv_;
    std::deque<AudioUtils::AudioWindow> queue_;
    bool busy_ = false;
    bool stopping_ = false;
    std::thread thread_;
    std::atomic<uint64_t> completed_{0};
};

}  // namespace transcription
