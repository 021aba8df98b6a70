#include "transcription/transcription_worker.h"

#include "logging/logger.h"

#include <chrono>
#include <exception>
#include <utility>

namespace transcription {

TranscriptionWorker::TranscriptionWorker(std::string name,
                                         std::unique_ptr<TranscriptionBackend> backend,
                                         BeginHandler onBegin, ResultHandler onResult)
    : name_(std::move(name)),
      backend_(std::move(backend)),
      onBegin_(std::move(onBegin)),
      onResult_(std::move(onResult)) {}

TranscriptionWorker::~TranscriptionWorker() {
    stop();
}

void TranscriptionWorker::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable()) {
        return;
    }
    stopping_ = false;
    thread_ = std::thread([this]() { workerLoop(); });
    LOG_DEBUG("[Transcription:{}] worker started (backend: {})", name_,
              backend_ ? backend_->name() : "null");
}

bool TranscriptionWorker::submit(AudioUtils::AudioWindow window) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        queue_.push_back(std::move(window));
        if (queue_.size() > 1 || busy_) {
            LOG_DEBUG("[Transcription:{}] window queued behind {} pending", name_,
                      queue_.size() - 1 + (busy_ ? 1 : 0));
        }
    }
    queueCv_.notify_one();
    return true;
}

void TranscriptionWorker::drain() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!thread_.joinable()) {
        return;
    }
    idleCv_.wait(lock, [this]() { return queue_.empty() && !busy_; });
}

void TranscriptionWorker::stop() {
    drain();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    queueCv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

size_t TranscriptionWorker::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size() + (busy_ ? 1 : 0);
}

TranscriptionResult TranscriptionWorker::runBackend(const AudioUtils::AudioWindow& window) {
    if (!backend_) {
        return {TranscriptionStatus::InvalidConfig, "", "no transcription backend"};
    }
    try {
        return backend_->transcribe(window.samples);
    } catch (const std::exception& e) {
        return {TranscriptionStatus::Error, "", e.what()};
    }
}

void TranscriptionWorker::workerLoop() {
    while (true) {
        AudioUtils::AudioWindow window;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queueCv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                break;  // stopping_ and nothing left
            }
            window = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        if (onBegin_) {
            try {
                onBegin_(window);
            } catch (const std::exception& e) {
                LOG_ERROR("[Transcription:{}] begin callback threw: {}", name_, e.what());
            }
        }

        auto started = std::chrono::steady_clock::now();
        TranscriptionResult result = runBackend(window);
        auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::steady_clock::now() - started)
                             .count();
        LOG_DEBUG("[Transcription:{}] {:.2f}s-{:.2f}s -> {} in {} ms", name_, window.startTime,
                  window.endTime, statusToString(result.status), elapsedMs);

        if (onResult_) {
            try {
                onResult_(window, result);
            } catch (const std::exception& e) {
                LOG_ERROR("[Transcription:{}] result for {:.2f}s-{:.2f}s not delivered: {}", name_,
                          window.startTime, window.endTime, e.what());
            }
        }
        completed_.fetch_add(1, std::memory_order_relaxed);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
            if (queue_.empty()) {
                idleCv_.notify_all();
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        busy_ = false;
    }
    idleCv_.notify_all();
}

}  // namespace transcription
